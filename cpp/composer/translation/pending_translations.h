#ifndef LINGUACOACH_COMPOSER_PENDING_TRANSLATIONS_H
#define LINGUACOACH_COMPOSER_PENDING_TRANSLATIONS_H

#include "composer/translation/translation_service.h"

#include <cstddef>
#include <cstdint>
#include <unordered_map>

namespace composer {

/**
 * Callbacks of in-flight translations, keyed by the ticket handed to the host.
 * A ticket is released when it completes.
 */
class PendingTranslations {
public:
    std::uint32_t add(TranslationService::Callback done);

    /**
     * Run and release the callback for a ticket.
     * @return False for unknown or already completed tickets
     */
    bool complete(std::uint32_t ticket, const TranslationResult& result);

    std::size_t size() const noexcept { return pending_.size(); }

private:
    std::unordered_map<std::uint32_t, TranslationService::Callback> pending_;
    std::uint32_t nextTicket_ = 1;
};

} // namespace composer

#endif // LINGUACOACH_COMPOSER_PENDING_TRANSLATIONS_H
