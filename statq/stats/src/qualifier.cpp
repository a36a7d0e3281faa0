#include <statq/stats/qualifier.hpp>
#include <format>

namespace statq::stats {

bool matches(const QualifierQuery& query, const Qualifier& stored) {
    switch (query.mode) {
        case QueryMode::Aggregate:
            if ((stored.all_of & ~query.all_of) != 0) return false;
            return stored.any_of == 0 || (stored.any_of & query.all_of) != 0;
        case QueryMode::Exact:
            return stored.all_of == query.all_of && stored.any_of == query.any_of;
    }
    return false;
}

bool Qualifier::qualifies_as(const QualifierQuery& query) const {
    return matches(query, *this);
}

std::string to_string(const Qualifier& qualifier) {
    if (qualifier.any_of == 0) {
        return std::format("all_of={:#x}", qualifier.all_of);
    }
    return std::format("all_of={:#x} any_of={:#x}", qualifier.all_of, qualifier.any_of);
}

std::string to_string(const QualifierQuery& query) {
    if (query.mode == QueryMode::Aggregate) {
        return std::format("Aggregate({:#x})", query.all_of);
    }
    return std::format("Exact({:#x}, {:#x})", query.all_of, query.any_of);
}

} // namespace statq::stats
