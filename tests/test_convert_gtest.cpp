// ==============================================================================
// test_convert_gtest.cpp - Тесты конверсии XML -> Value (GoogleTest)
// ==============================================================================
//
// Ответы EVE API берутся в виде строк: ServerStatus, Characters и
// синтетические документы для граничных случаев.
//
// ==============================================================================

#include "eveapi/convert.hpp"

#include <gtest/gtest.h>
#include <pugixml.hpp>
#include <string>

namespace eveapi::test {

namespace {

constexpr const char* SERVER_STATUS_XML = R"(<?xml version='1.0' encoding='UTF-8'?>
<eveapi version="2">
  <currentTime>2011-08-30 22:34:41</currentTime>
  <result>
    <serverOpen>True</serverOpen>
    <onlinePlayers>30356</onlinePlayers>
  </result>
  <cachedUntil>2011-08-30 22:37:41</cachedUntil>
</eveapi>
)";

constexpr const char* CHARACTERS_XML = R"(<?xml version='1.0' encoding='UTF-8'?>
<eveapi version="2">
  <currentTime>2011-08-30 22:34:41</currentTime>
  <result>
    <rowset name="characters" key="characterID" columns="name,characterID,corporationName,corporationID">
      <row name="Alpha" characterID="499939401" corporationName="Corp A" corporationID="1000009" />
      <row name="Beta" characterID="1655827332" corporationName="Corp B" corporationID="1000167" />
    </rowset>
  </result>
  <cachedUntil>2011-08-30 23:31:41</cachedUntil>
</eveapi>
)";

void load(pugi::xml_document& doc, const char* xml) {
    pugi::xml_parse_result parsed = doc.load_string(xml);
    ASSERT_TRUE(parsed) << parsed.description();
}

}  // namespace

// ==============================================================================
// Общие элементы
// ==============================================================================

TEST(ConvertTest, ServerStatus_FullStructure) {
    pugi::xml_document doc;
    load(doc, SERVER_STATUS_XML);
    Value v = convert_document(doc);

    ASSERT_EQ(v.object_size(), 1u);
    const Value* root = v.find("eveapi");
    ASSERT_NE(root, nullptr);
    EXPECT_EQ(root->object_size(), 4u);  // attributes, currentTime, result, cachedUntil

    EXPECT_EQ(*v.find_string("eveapi.attributes.version"), "2");
    EXPECT_EQ(*v.find_string("eveapi.currentTime.text"), "2011-08-30 22:34:41");
    EXPECT_EQ(*v.find_string("eveapi.result.serverOpen.text"), "True");
    EXPECT_EQ(*v.find_string("eveapi.result.onlinePlayers.text"), "30356");
    EXPECT_EQ(*v.find_string("eveapi.cachedUntil.text"), "2011-08-30 22:37:41");
    EXPECT_EQ(v.find("eveapi.result")->object_size(), 2u);
}

TEST(ConvertTest, ServerStatus_WhitespaceTextSkipped) {
    pugi::xml_document doc;
    load(doc, SERVER_STATUS_XML);
    Value v = convert_document(doc);

    // Переводы строк между элементами не дают ключа text
    EXPECT_EQ(v.find("eveapi.text"), nullptr);
    EXPECT_EQ(v.find("eveapi.result.text"), nullptr);
}

TEST(ConvertTest, Text_IsTrimmed) {
    pugi::xml_document doc;
    load(doc, "<a><b>  padded value \n</b></a>");
    Value v = convert_document(doc);
    EXPECT_EQ(*v.find_string("a.b.text"), "padded value");
}

TEST(ConvertTest, ChildAttributes_GoToParentPath) {
    pugi::xml_document doc;
    load(doc, R"(<a><b x="1" y="2">t</b></a>)");
    Value v = convert_document(doc);

    EXPECT_EQ(*v.find_string("a.attributes.x"), "1");
    EXPECT_EQ(*v.find_string("a.attributes.y"), "2");
    EXPECT_EQ(*v.find_string("a.b.text"), "t");
}

TEST(ConvertTest, SiblingAttributes_AreMerged) {
    pugi::xml_document doc;
    load(doc, R"(<a><b x="1"/><c y="2"/></a>)");
    Value v = convert_document(doc);

    const Value* attrs = v.find("a.attributes");
    ASSERT_NE(attrs, nullptr);
    EXPECT_EQ(attrs->object_size(), 2u);
}

TEST(ConvertTest, RepeatedElements_LastTextWins) {
    pugi::xml_document doc;
    load(doc, "<a><b>first</b><b>second</b></a>");
    Value v = convert_document(doc);
    EXPECT_EQ(*v.find_string("a.b.text"), "second");
}

TEST(ConvertTest, Cdata_TreatedAsText) {
    pugi::xml_document doc;
    load(doc, "<a><b><![CDATA[ <raw> & text ]]></b></a>");
    Value v = convert_document(doc);
    EXPECT_EQ(*v.find_string("a.b.text"), "<raw> & text");
}

TEST(ConvertTest, CommentsIgnored) {
    pugi::xml_document doc;
    load(doc, "<a><!-- note --><b>1</b></a>");
    Value v = convert_document(doc);
    EXPECT_EQ(v.find("a")->object_size(), 1u);
}

TEST(ConvertTest, EmptyDocument_EmptyObject) {
    pugi::xml_document doc;
    Value v = convert_document(doc);
    EXPECT_TRUE(v.is_object());
    EXPECT_EQ(v.object_size(), 0u);
}

TEST(ConvertTest, ConvertElement_PathPrefixKept) {
    pugi::xml_document doc;
    load(doc, "<root><inner><leaf>v</leaf></inner></root>");
    Value::Object m = convert_element(doc.document_element().child("inner"), {"x", "y"});

    Value v(std::move(m));
    EXPECT_EQ(*v.find_string("x.y.leaf.text"), "v");
}

// ==============================================================================
// Rowset
// ==============================================================================

TEST(ConvertTest, Characters_RowsKeyedById) {
    pugi::xml_document doc;
    load(doc, CHARACTERS_XML);
    Value v = convert_document(doc);

    const Value* characters = v.find("eveapi.result.characters");
    ASSERT_NE(characters, nullptr);
    EXPECT_EQ(characters->object_size(), 2u);

    const Value* row = v.find("eveapi.result.characters.499939401");
    ASSERT_NE(row, nullptr);
    Value expected(Value::Object{{"name", Value("Alpha")},
                                 {"characterID", Value("499939401")},
                                 {"corporationName", Value("Corp A")},
                                 {"corporationID", Value("1000009")}});
    EXPECT_EQ(*row, expected);
}

TEST(ConvertTest, Characters_RowsetAttributesUnderResult) {
    pugi::xml_document doc;
    load(doc, CHARACTERS_XML);
    Value v = convert_document(doc);

    EXPECT_EQ(*v.find_string("eveapi.result.attributes.key"), "characterID");
    EXPECT_EQ(*v.find_string("eveapi.result.attributes.name"), "characters");
    EXPECT_NE(v.find_string("eveapi.result.attributes.columns"), nullptr);
}

TEST(ConvertTest, Rowset_DuplicateKey_LastRowReplaces) {
    pugi::xml_document doc;
    load(doc, R"(<r><rowset name="items" key="id">
        <row id="1" a="x" extra="only-first"/>
        <row id="2" a="y"/>
        <row id="1" a="z"/>
    </rowset></r>)");
    Value v = convert_document(doc);

    const Value* items = v.find("r.items");
    ASSERT_NE(items, nullptr);
    EXPECT_EQ(items->object_size(), 2u);

    Value expected(Value::Object{{"id", Value("1")}, {"a", Value("z")}});
    EXPECT_EQ(*v.find("r.items.1"), expected);
}

TEST(ConvertTest, Rowset_Empty_EmptyObject) {
    pugi::xml_document doc;
    load(doc, R"(<r><rowset name="skills" key="typeID" columns="typeID"/></r>)");
    Value v = convert_document(doc);

    const Value* skills = v.find("r.skills");
    ASSERT_NE(skills, nullptr);
    EXPECT_TRUE(skills->is_object());
    EXPECT_EQ(skills->object_size(), 0u);
}

TEST(ConvertTest, Rowset_NonRowChildrenIgnored) {
    pugi::xml_document doc;
    load(doc, R"(<r><rowset name="s" key="id"><row id="1"/><other id="2"/>text</rowset></r>)");
    Value v = convert_document(doc);
    EXPECT_EQ(v.find("r.s")->object_size(), 1u);
}

TEST(ConvertTest, Rowset_NestedUnderElement) {
    pugi::xml_document doc;
    load(doc, R"(<eveapi><result><corp><rowset name="members" key="id"><row id="7" n="x"/></rowset></corp></result></eveapi>)");
    Value v = convert_document(doc);
    EXPECT_EQ(*v.find_string("eveapi.result.corp.members.7.n"), "x");
}

TEST(ConvertTest, Rowset_MissingKey_Throws) {
    pugi::xml_document doc;
    load(doc, R"(<r><rowset name="items"><row id="1"/></rowset></r>)");
    EXPECT_THROW(convert_document(doc), MalformedResponseError);
}

TEST(ConvertTest, Rowset_MissingName_Throws) {
    pugi::xml_document doc;
    load(doc, R"(<r><rowset key="id"><row id="1"/></rowset></r>)");
    try {
        convert_document(doc);
        FAIL() << "expected MalformedResponseError";
    } catch (const MalformedResponseError& e) {
        EXPECT_EQ(e.path(), (KeyPath{"r"}));
        EXPECT_NE(std::string(e.what()).find("'name'"), std::string::npos);
    }
}

TEST(ConvertTest, Row_MissingKeyAttribute_Throws) {
    pugi::xml_document doc;
    load(doc, R"(<r><rowset name="items" key="id"><row other="1"/></rowset></r>)");
    try {
        convert_document(doc);
        FAIL() << "expected MalformedResponseError";
    } catch (const MalformedResponseError& e) {
        EXPECT_EQ(e.path(), (KeyPath{"r", "items"}));
    }
}

TEST(ConvertTest, ConvertRowset_Direct) {
    pugi::xml_document doc;
    load(doc, R"(<rowset name="x" key="k"><row k="a" v="1"/><row k="b" v="2"/></rowset>)");
    Value v(convert_rowset(doc.document_element(), {"p", "x"}, "k"));
    EXPECT_EQ(*v.find_string("p.x.b.v"), "2");
}

// ==============================================================================
// Детерминизм и ограничения
// ==============================================================================

TEST(ConvertTest, SameDocumentTwice_StructurallyEqual) {
    pugi::xml_document doc;
    load(doc, CHARACTERS_XML);
    EXPECT_EQ(convert_document(doc), convert_document(doc));
}

TEST(ConvertTest, DepthLimit_Exceeded_Throws) {
    std::string xml;
    for (int i = 0; i < 20; ++i) {
        xml += "<n>";
    }
    xml += "x";
    for (int i = 0; i < 20; ++i) {
        xml += "</n>";
    }
    pugi::xml_document doc;
    load(doc, xml.c_str());

    ConvertOptions options;
    options.max_depth = 10;
    EXPECT_THROW(convert_document(doc, options), MalformedResponseError);

    options.max_depth = 64;
    EXPECT_NO_THROW(convert_document(doc, options));
}

TEST(ConvertTest, TrimText_Basic) {
    EXPECT_EQ(trim_text("  a b  "), "a b");
    EXPECT_EQ(trim_text("\n\t "), "");
    EXPECT_EQ(trim_text(nullptr), "");
}

TEST(ConvertTest, AttributesToObject_AllAttributes) {
    pugi::xml_document doc;
    load(doc, R"(<e a="1" b="two"/>)");
    Value::Object attrs = attributes_to_object(doc.document_element());
    EXPECT_EQ(attrs.size(), 2u);
    EXPECT_EQ(attrs.at("b"), Value("two"));
}

}  // namespace eveapi::test
