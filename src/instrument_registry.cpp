#include "bourse/instrument_registry.hpp"
#include "bourse/input_validation.hpp"
#include "bourse/logger.hpp"
#include <mutex>

namespace bourse {

Result<Instrument> InstrumentRegistry::add(std::string_view ticker, std::string_view kind) {
    auto normalized = FieldValidators::validate_ticker(ticker);
    if (normalized.has_error()) {
        return normalized.error();
    }
    auto kind_check = FieldValidators::validate_kind(kind);
    if (kind_check.has_error()) {
        return kind_check.error();
    }

    Instrument instrument{normalized.value(), std::string(kind), std::chrono::system_clock::now()};

    std::unique_lock lock(mutex_);
    auto [it, inserted] = instruments_.emplace(instrument.ticker, instrument);
    if (!inserted) {
        return ErrorCode::INSTRUMENT_EXISTS;
    }

    LOG_INFO_SAFE("Instrument {} ({}) listed", instrument.ticker, instrument.kind);
    return instrument;
}

Result<void> InstrumentRegistry::remove(const std::string& ticker) {
    std::unique_lock lock(mutex_);
    if (instruments_.erase(ticker) == 0) {
        return ErrorCode::INSTRUMENT_NOT_FOUND;
    }
    LOG_INFO_SAFE("Instrument {} delisted", ticker);
    return Result<void>();
}

std::optional<Instrument> InstrumentRegistry::find(const std::string& ticker) const {
    std::shared_lock lock(mutex_);
    auto it = instruments_.find(ticker);
    if (it == instruments_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool InstrumentRegistry::exists(const std::string& ticker) const {
    std::shared_lock lock(mutex_);
    return instruments_.count(ticker) > 0;
}

std::vector<Instrument> InstrumentRegistry::list() const {
    std::shared_lock lock(mutex_);
    std::vector<Instrument> result;
    result.reserve(instruments_.size());
    for (const auto& [ticker, instrument] : instruments_) {
        result.push_back(instrument);
    }
    return result;
}

} // namespace bourse
