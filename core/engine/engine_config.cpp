#include "engine/engine_config.hpp"
#include "common/errors.hpp"

#include <string>

namespace ctxguard {

void EngineConfig::validate() const {
    risk.validate();
    ranking.validate();
    validateLayout(layout);
    if (min_connections < 0) {
        throw InvalidParameter("min_connections must be >= 0, got " +
                               std::to_string(min_connections));
    }
}

} // namespace ctxguard
