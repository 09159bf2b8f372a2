#ifndef LINGUACOACH_COMPOSER_TRANSLATION_SERVICE_H
#define LINGUACOACH_COMPOSER_TRANSLATION_SERVICE_H

#include <functional>
#include <string>
#include <utility>

namespace composer {

struct TranslationResult {
    bool ok = false;
    std::string text;
    std::string error;

    static TranslationResult success(std::string translated) {
        TranslationResult r;
        r.ok = true;
        r.text = std::move(translated);
        return r;
    }

    static TranslationResult failure(std::string message) {
        TranslationResult r;
        r.error = std::move(message);
        return r;
    }
};

/**
 * TranslationService: external, possibly asynchronous translator.
 *
 * The callback is invoked exactly once, either from inside translate() or
 * later on the engine thread. Text may contain the "<br/>" line-break marker,
 * which the service must keep in place.
 */
class TranslationService {
public:
    using Callback = std::function<void(const TranslationResult&)>;

    virtual ~TranslationService() = default;

    virtual void translate(const std::string& text, const std::string& targetLanguage, Callback done) = 0;
};

} // namespace composer

#endif // LINGUACOACH_COMPOSER_TRANSLATION_SERVICE_H
