#include "composer/translation/pending_translations.h"

#include <utility>

namespace composer {

std::uint32_t PendingTranslations::add(TranslationService::Callback done) {
    const std::uint32_t ticket = nextTicket_++;
    pending_.emplace(ticket, std::move(done));
    return ticket;
}

bool PendingTranslations::complete(std::uint32_t ticket, const TranslationResult& result) {
    auto it = pending_.find(ticket);
    if (it == pending_.end()) {
        return false;
    }
    // Erase first: the callback may start another translation.
    TranslationService::Callback done = std::move(it->second);
    pending_.erase(it);
    if (done) {
        done(result);
    }
    return true;
}

} // namespace composer
