#pragma once

#include "bourse/error_handling.hpp"
#include "bourse/thread_safety.hpp"
#include "bourse/types.hpp"
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace bourse {

class InstrumentRegistry {
public:
    // Ticker is normalized to uppercase before it is stored
    Result<Instrument> add(std::string_view ticker, std::string_view kind);
    Result<void> remove(const std::string& ticker);

    std::optional<Instrument> find(const std::string& ticker) const;
    bool exists(const std::string& ticker) const;

    // Ordered by ticker
    std::vector<Instrument> list() const;

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, Instrument> instruments_ GUARDED_BY(mutex_);
};

} // namespace bourse
