#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/emscripten.h>
#include <emscripten/val.h>
#endif

#include "composer/composer_engine.h"
#include "composer/core/logging.h"
#include "composer/translation/pending_translations.h"

#ifdef EMSCRIPTEN
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

using composer::commands::Key;
using composer::commands::KeyEvent;
using emscripten::val;

namespace {

// Measures through the page: host.measureWidth(text, family, sizePx) -> number, host.viewportWidth(), host.viewportHeight().
class JsMetricsProvider : public composer::text::MetricsProvider {
public:
    explicit JsMetricsProvider(val host) : host_(std::move(host)) {}

    bool measureWidth(std::string_view text, const composer::text::FontDescriptor& font, float& outWidthPx) const override {
        const val result = host_.call<val>("measureWidth", std::string(text), font.family, font.sizePx);
        if (!result.isNumber()) {
            return false;
        }
        outWidthPx = result.as<float>();
        return true;
    }

    float viewportWidth() const override { return host_.call<float>("viewportWidth"); }
    float viewportHeight() const override { return host_.call<float>("viewportHeight"); }

private:
    val host_;
};

// host.translate(text, lang, ticket); the page answers with Composer.resolveTranslation(ticket, ok, payload).
class JsTranslationService : public composer::TranslationService {
public:
    explicit JsTranslationService(val host) : host_(std::move(host)) {}

    void translate(const std::string& text, const std::string& targetLanguage, Callback done) override {
        const std::uint32_t ticket = pending_.add(std::move(done));
        host_.call<void>("translate", text, targetLanguage, ticket);
    }

    void resolve(std::uint32_t ticket, bool ok, const std::string& payload) {
        const composer::TranslationResult result = ok
            ? composer::TranslationResult::success(payload)
            : composer::TranslationResult::failure(payload);
        if (!pending_.complete(ticket, result)) {
            COMPOSER_LOG_WARN("JsTranslationService: unknown ticket %u", ticket);
        }
    }

private:
    val host_;
    composer::PendingTranslations pending_;
};

class JsListener : public composer::ComposerListener {
public:
    explicit JsListener(val host) : host_(std::move(host)) {}

    void onBufferChanged(const std::string& text, composer::SelectionRange selection) override {
        host_.call<void>("onBufferChanged", text, selection.start, selection.end);
    }
    void onCaretChanged(const composer::CaretInfo& caret) override {
        host_.call<void>("onCaretChanged", caret.logicalLine, caret.column, caret.visualLine, caret.cursorPosition);
    }
    void onScrollRequested(float scrollTopPx) override {
        host_.call<void>("onScrollRequested", scrollTopPx);
    }
    void onTranslationStateChanged(const composer::SelectionTranslationState& state) override {
        host_.call<void>("onTranslationStateChanged", state.selectedText, state.translatedText, state.isTranslating);
    }
    void onNotification(composer::ComposerError error, const std::string& message) override {
        host_.call<void>("onNotification", std::string(composer::errorName(error)), message);
    }
    void onSend(const std::string& text, bool asNote) override {
        host_.call<void>("onSend", text, asNote);
    }
    void onPreferredLanguageChanged(const std::string& language) override {
        host_.call<void>("onPreferredLanguageChanged", language);
    }

private:
    val host_;
};

// Owns the JS adapters together with the engine they feed.
class WebComposer {
public:
    explicit WebComposer(val host)
        : metrics_(host)
        , translation_(host)
        , listener_(host)
        , engine_(metrics_, &translation_) {
        engine_.setListener(&listener_);
    }

    ComposerEngine& engine() { return engine_; }

    bool keyDown(int key, std::uint32_t character, std::uint32_t modifiers) {
        KeyEvent event{static_cast<Key>(key), static_cast<char32_t>(character), modifiers};
        const bool consumed = engine_.handleKeyDown(event).consumed;
        engine_.runDeferred();
        return consumed;
    }

    void resolveTranslation(std::uint32_t ticket, bool ok, const std::string& payload) {
        translation_.resolve(ticket, ok, payload);
        engine_.runDeferred();
    }

    void setBuffer(const std::string& text, std::uint32_t start, std::uint32_t end) { engine_.setBuffer(text, start, end); }
    std::string getBuffer() { return engine_.getBuffer(); }
    void selectionChange(std::uint32_t start, std::uint32_t end) { engine_.handleSelectionChange(start, end); }
    void resize() { engine_.handleResize(); }
    void scroll(float scrollTopPx) { engine_.handleScroll(scrollTopPx); }
    void wheel() { engine_.handleWheel(); }
    bool undo() { return engine_.undo(); }
    bool redo() { return engine_.redo(); }
    bool translateSelection(const std::string& language) { return engine_.translateSelection(language); }
    void clearSelection() { engine_.clearSelection(); }
    bool sendAsNote() { return engine_.sendAsNote(); }
    bool sendSelection() { return engine_.sendSelection(); }
    bool revertAnnotations() { return engine_.revertAnnotations(); }
    std::string displayText() { return engine_.displayText(); }
    std::string preferredLanguage() { return engine_.preferredLanguage(); }
    void setPreferredLanguage(const std::string& language) { engine_.setPreferredLanguage(language); }
    std::size_t runDeferred() { return engine_.runDeferred(); }
    std::size_t pumpTimers() { return engine_.pumpTimers(); }

    val saveDraft() {
        const std::vector<std::uint8_t> bytes = engine_.saveDraft();
        return val::global("Uint8Array").new_(val(emscripten::typed_memory_view(bytes.size(), bytes.data())));
    }

    std::uint32_t loadDraft(const std::string& bytes) {
        return static_cast<std::uint32_t>(engine_.loadDraft(
            reinterpret_cast<const std::uint8_t*>(bytes.data()), bytes.size()));
    }

private:
    JsMetricsProvider metrics_;
    JsTranslationService translation_;
    JsListener listener_;
    ComposerEngine engine_;
};

} // namespace

EMSCRIPTEN_BINDINGS(composer_engine_module) {
    emscripten::enum_<Key>("Key")
        .value("Character", Key::Character)
        .value("Enter", Key::Enter)
        .value("Tab", Key::Tab)
        .value("Backspace", Key::Backspace)
        .value("Delete", Key::Delete)
        .value("Escape", Key::Escape)
        .value("ArrowUp", Key::ArrowUp)
        .value("ArrowDown", Key::ArrowDown)
        .value("ArrowLeft", Key::ArrowLeft)
        .value("ArrowRight", Key::ArrowRight)
        .value("Home", Key::Home)
        .value("End", Key::End)
        .value("PageUp", Key::PageUp)
        .value("PageDown", Key::PageDown)
        .value("Other", Key::Other);

    emscripten::class_<WebComposer>("Composer")
        .constructor<val>()
        .function("keyDown", &WebComposer::keyDown)
        .function("resolveTranslation", &WebComposer::resolveTranslation)
        .function("setBuffer", &WebComposer::setBuffer)
        .function("getBuffer", &WebComposer::getBuffer)
        .function("selectionChange", &WebComposer::selectionChange)
        .function("resize", &WebComposer::resize)
        .function("scroll", &WebComposer::scroll)
        .function("wheel", &WebComposer::wheel)
        .function("undo", &WebComposer::undo)
        .function("redo", &WebComposer::redo)
        .function("translateSelection", &WebComposer::translateSelection)
        .function("clearSelection", &WebComposer::clearSelection)
        .function("sendAsNote", &WebComposer::sendAsNote)
        .function("sendSelection", &WebComposer::sendSelection)
        .function("revertAnnotations", &WebComposer::revertAnnotations)
        .function("displayText", &WebComposer::displayText)
        .function("preferredLanguage", &WebComposer::preferredLanguage)
        .function("setPreferredLanguage", &WebComposer::setPreferredLanguage)
        .function("runDeferred", &WebComposer::runDeferred)
        .function("pumpTimers", &WebComposer::pumpTimers)
        .function("saveDraft", &WebComposer::saveDraft)
        .function("loadDraft", &WebComposer::loadDraft);
}
#endif
