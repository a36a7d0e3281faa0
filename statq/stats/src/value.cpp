#include <statq/stats/value.hpp>
#include <format>

namespace statq::stats {

std::string Value::to_string() const {
    switch (m_type) {
        case Type::None:
            return "none";
        case Type::Bool:
            return std::get<bool>(m_value) ? "true" : "false";
        case Type::Int:
            return std::to_string(std::get<int64_t>(m_value));
        case Type::Float:
            return std::format("{}", std::get<double>(m_value));
    }
    return "";
}

} // namespace statq::stats
