#include <gtest/gtest.h>
#include "composer/annotation/annotation.h"

using namespace composer::annotation;

TEST(AnnotationTest, DetectsDelimiterAndLines) {
    EXPECT_TRUE(hasDelimiter("Hola :: Hello"));
    EXPECT_FALSE(hasDelimiter("Hola::Hello"));
    EXPECT_FALSE(hasDelimiter("ratio 3:2"));
    EXPECT_TRUE(isMultiLine("a\nb"));
    EXPECT_FALSE(isMultiLine("a b"));
}

TEST(AnnotationTest, OriginalIsLeftOfFirstDelimiter) {
    EXPECT_EQ(originalOf("Hola :: Hello"), "Hola");
    EXPECT_EQ(originalOf("a :: b :: c"), "a");
    EXPECT_EQ(originalOf("plain"), "plain");
}

TEST(AnnotationTest, ExtractOriginalsStripsEveryAnnotation) {
    EXPECT_EQ(extractOriginals("Hola :: Hello\nplain\n\nAdios :: Bye"), "Hola\nplain\n\nAdios");
    EXPECT_EQ(extractOriginals(""), "");
}

// =============================================================================
// Service wire format
// =============================================================================

TEST(AnnotationTest, NewlinesTravelAsLineBreakMarkers) {
    EXPECT_EQ(encodeForService("a\nb"), "a<br/>b");
    EXPECT_EQ(encodeForService("a\n\nb\n"), "a<br/><br/>b<br/>");
    EXPECT_EQ(encodeForService("single"), "single");
}

TEST(AnnotationTest, DecodesAllLineBreakSpellings) {
    EXPECT_EQ(decodeServiceText("a<br/>b<br>c<BR />d<br/> e"), "a\nb\nc\nd\ne");
    EXPECT_EQ(decodeServiceText("a<br/>  b"), "a\n b");  // only one space is eaten
    EXPECT_EQ(decodeServiceText("<bold>"), "<bold>");
    EXPECT_EQ(decodeServiceText("x <br"), "x <br");
}

TEST(AnnotationTest, DecodesHtmlEntities) {
    EXPECT_EQ(decodeHtmlEntities("Tom &amp; Jerry &quot;x&quot; &#39;y&#39; &#x41; &unknown; & done"),
              "Tom & Jerry \"x\" 'y' A &unknown; & done");
    EXPECT_EQ(decodeHtmlEntities("&iquest;Qu&eacute;?"), "\xC2\xBFQu&eacute;?");
    EXPECT_EQ(decodeHtmlEntities("&lt;br/&gt;"), "<br/>");
    EXPECT_EQ(decodeHtmlEntities("caf&#233;"), "caf\xC3\xA9");
    EXPECT_EQ(decodeHtmlEntities("&#0;"), "\xEF\xBF\xBD");
}

TEST(AnnotationTest, MalformedNumericEntitiesStayLiteral) {
    EXPECT_EQ(decodeHtmlEntities("&#-1;"), "&#-1;");
    EXPECT_EQ(decodeHtmlEntities("&# 65;"), "&# 65;");
    EXPECT_EQ(decodeHtmlEntities("&#+65;"), "&#+65;");
    EXPECT_EQ(decodeHtmlEntities("&#x-41;"), "&#x-41;");
    EXPECT_EQ(decodeHtmlEntities("&#xG1;"), "&#xG1;");
    EXPECT_EQ(decodeHtmlEntities("&#X41;&#65;"), "AA");
}

TEST(AnnotationTest, EscapedLineBreakIsNotALineBreak) {
    // Entities decode after line breaks, so an escaped tag stays text
    EXPECT_EQ(decodeServiceText("a&lt;br/&gt;b"), "a<br/>b");
}

// =============================================================================
// Merging
// =============================================================================

TEST(AnnotationTest, MergePairsPlainLines) {
    EXPECT_EQ(mergeTranslation("Hola", "Hello"), "Hola :: Hello");
    EXPECT_EQ(mergeTranslation("uno\n\ndos", "one\n\ntwo"), "uno :: one\n\ndos :: two");
}

TEST(AnnotationTest, MergeKeepsPlainLineWhenTranslationShort) {
    EXPECT_EQ(mergeTranslation("uno\ndos", "one"), "uno :: one\ndos :: ");
    EXPECT_EQ(mergeTranslation("uno", "one\nextra"), "uno :: one");
}

TEST(AnnotationTest, MergeReplacesExistingTranslation) {
    EXPECT_EQ(mergeTranslation("Hola :: Hello", "Bonjour"), "Hola :: Bonjour");
}

TEST(AnnotationTest, MergeReannotatesMixedSelection) {
    EXPECT_EQ(mergeTranslation("Hola :: Hello\nnuevo\n\nfin :: end", "Bonjour\n\n\nFin"),
              "Hola :: Bonjour\nnuevo\n\nfin :: Fin");
    EXPECT_EQ(mergeTranslation("Hola :: Hello\nnuevo", "Bonjour\nnouveau"),
              "Hola :: Bonjour\nnuevo :: nouveau");
}

TEST(AnnotationTest, MergeIsIdempotentOnOriginals) {
    const std::string once = mergeTranslation("Hola\nAdios", "Hello\nBye");
    const std::string twice = mergeTranslation(once, "Bonjour\nAu revoir");
    EXPECT_EQ(twice, "Hola :: Bonjour\nAdios :: Au revoir");
    EXPECT_EQ(extractOriginals(twice), "Hola\nAdios");
}
