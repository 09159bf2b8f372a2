#include <gtest/gtest.h>
#include "composer/commands/keyboard_dispatcher.h"
#include "composer/composer_engine.h"
#include "composer/text/cell_metrics_provider.h"
#include "test_support.h"

using namespace composer;
using namespace composer::commands;

namespace {

CommandAction actionFor(const KeyEvent& event) {
    const ChordBinding* binding = resolveChord(event);
    return binding ? binding->action : CommandAction::None;
}

const std::uint32_t kCtrl = modifierBit(KeyModifier::Ctrl);
const std::uint32_t kCtrlShift = KeyModifier::Ctrl | KeyModifier::Shift;

} // namespace

// =============================================================================
// Chord table
// =============================================================================

TEST(ChordTableTest, FormattingChords) {
    EXPECT_EQ(actionFor(KeyEvent::chord(U'b', kCtrl)), CommandAction::Bold);
    EXPECT_EQ(actionFor(KeyEvent::chord(U'i', kCtrl)), CommandAction::Italic);
    EXPECT_EQ(actionFor(KeyEvent::chord(U'k', kCtrl)), CommandAction::Code);
    EXPECT_EQ(actionFor(KeyEvent::chord(U'B', kCtrl)), CommandAction::Bold);  // caps lock
}

TEST(ChordTableTest, PlainCharactersAreNotCommands) {
    EXPECT_EQ(resolveChord(KeyEvent::chord(U'b', 0)), nullptr);
    EXPECT_EQ(resolveChord(KeyEvent::chord(U'b', modifierBit(KeyModifier::Meta))), nullptr);
    EXPECT_EQ(resolveChord(KeyEvent::chord(U'b', KeyModifier::Ctrl | KeyModifier::Alt)), nullptr);
    EXPECT_EQ(resolveChord(KeyEvent::of(Key::Enter)), nullptr);
}

TEST(ChordTableTest, UndoAndRedoChords) {
    EXPECT_EQ(actionFor(KeyEvent::chord(U'z', kCtrl)), CommandAction::Undo);
    EXPECT_EQ(actionFor(KeyEvent::chord(U'Z', kCtrlShift)), CommandAction::Redo);
    EXPECT_EQ(actionFor(KeyEvent::chord(U'y', kCtrl)), CommandAction::Redo);
}

TEST(ChordTableTest, TranslateNeedsShift) {
    EXPECT_EQ(actionFor(KeyEvent::chord(U'T', kCtrlShift)), CommandAction::TranslateSelection);
    EXPECT_EQ(actionFor(KeyEvent::chord(U't', kCtrl)), CommandAction::None);
}

TEST(ChordTableTest, TabIndentsOnlyWithoutCommandModifiers) {
    const ChordBinding* tab = resolveChord(KeyEvent::of(Key::Tab));
    ASSERT_NE(tab, nullptr);
    EXPECT_EQ(tab->action, CommandAction::Indent);
    EXPECT_TRUE(tab->consumes);
    EXPECT_EQ(resolveChord(KeyEvent::of(Key::Tab, kCtrl)), nullptr);
}

TEST(ChordTableTest, NavigationIsNotConsumed) {
    for (Key key : {Key::ArrowUp, Key::ArrowDown, Key::ArrowLeft, Key::ArrowRight,
                    Key::Home, Key::End, Key::PageUp, Key::PageDown}) {
        const ChordBinding* binding = resolveChord(KeyEvent::of(key, modifierBit(KeyModifier::Shift)));
        ASSERT_NE(binding, nullptr);
        EXPECT_EQ(binding->action, CommandAction::Navigate);
        EXPECT_FALSE(binding->consumes);
    }
}

TEST(ChordTableTest, SendAndClearChords) {
    EXPECT_EQ(actionFor(KeyEvent::of(Key::Enter, kCtrl)), CommandAction::SendAsNote);
    EXPECT_EQ(actionFor(KeyEvent::chord(U'e', kCtrl)), CommandAction::ClearSelection);

    const ChordBinding* backspace = resolveChord(KeyEvent::of(Key::Backspace));
    ASSERT_NE(backspace, nullptr);
    EXPECT_EQ(backspace->action, CommandAction::ResetSelection);
    EXPECT_FALSE(backspace->consumes);
}

TEST(ChordTableTest, ActionNames) {
    EXPECT_STREQ(actionName(CommandAction::Bold), "Bold");
    EXPECT_STREQ(actionName(CommandAction::TranslateSelection), "TranslateSelection");
}

// =============================================================================
// Dispatch into the engine
// =============================================================================

class KeyDispatchTest : public ::testing::Test {
protected:
    text::CellMetricsProvider metrics{10.0f, 116.0f, 200.0f};
    FakeTranslationService service;
    RecordingListener listener;
    ComposerEngine engine{metrics, &service};

    void SetUp() override {
        engine.setListener(&listener);
    }
};

TEST_F(KeyDispatchTest, UnboundKeyIsNotConsumed) {
    const KeyDispatchResult result = engine.handleKeyDown(KeyEvent::chord(U'a', 0));
    EXPECT_EQ(result.action, CommandAction::None);
    EXPECT_FALSE(result.consumed);
}

TEST_F(KeyDispatchTest, ItalicWrapsSelection) {
    engine.setBuffer("ciao bella", 5, 10);
    const KeyDispatchResult result = engine.handleKeyDown(KeyEvent::chord(U'i', kCtrl));
    EXPECT_EQ(result.action, CommandAction::Italic);
    EXPECT_TRUE(result.consumed);
    EXPECT_EQ(engine.getBuffer(), "ciao *bella*");
    EXPECT_EQ(listener.lastBuffer, "ciao *bella*");
}

TEST_F(KeyDispatchTest, CodeChordWrapsInBackticks) {
    engine.setBuffer("run ls", 4, 6);
    engine.handleKeyDown(KeyEvent::chord(U'k', kCtrl));
    EXPECT_EQ(engine.getBuffer(), "run `ls`");
}

TEST_F(KeyDispatchTest, ClearChordDropsTranslationState) {
    engine.setBuffer("Hola mundo");
    engine.handleSelectionChange(0, 4);
    ASSERT_TRUE(engine.translationState().hasSelection());

    const KeyDispatchResult result = engine.handleKeyDown(KeyEvent::chord(U'e', kCtrl));
    EXPECT_TRUE(result.consumed);
    EXPECT_FALSE(engine.translationState().hasSelection());
    EXPECT_EQ(engine.getBuffer(), "Hola mundo");
}

TEST_F(KeyDispatchTest, TranslateChordUsesPreferredLanguage) {
    engine.setPreferredLanguage("pt");
    engine.setBuffer("Hello");
    engine.handleSelectionChange(0, 5);

    engine.handleKeyDown(KeyEvent::chord(U't', kCtrlShift));
    ASSERT_EQ(service.requests.size(), 1u);
    EXPECT_EQ(service.requests[0].language, "pt");
}
