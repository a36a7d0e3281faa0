#include <statq/stats/evaluation_key.hpp>
#include <format>

namespace statq::stats {

std::string EvaluationKey::to_string() const {
    return std::format("entity {} {} stat#{:016x}",
                       entt::to_integral(entity), stats::to_string(query), stat.value());
}

} // namespace statq::stats
