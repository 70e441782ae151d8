//=============================================================================
// FontDiffer Tests
//
// End-to-end runs over pairs of FakeFonts. Font size 100 keeps the glyph
// rectangles on whole pixels (0.1 px per unit).
//=============================================================================

#include <boost/ut.hpp>
#include "harness/fake_font.h"

#include <fontdiff/diff.h>
#include <fontdiff/font-differ.h>

#include <set>
#include <string>

using namespace boost::ut;
using namespace fontdiff;
using namespace fontdiff::test;

namespace {

void addTables(FakeFont& font, int ascender = 800) {
    font.setTable("head", Value::object({{"units_per_em", 1000}, {"flags", 3}}));
    font.setTable("hhea", Value::object({{"ascender", ascender}, {"descender", -200}}));
}

// 'A' is a bar 200 units wide unless widened
void addLatin(FakeFont& font, float aRight = 300.0f) {
    font.addRectGlyph('A', 100, 0, aRight, 500, 400);
    font.addRectGlyph('B', 50, 0, 550, 700, 600);
    font.addBlankGlyph(' ', 250);
}

DiffOptions options() {
    DiffOptions o;
    o.fontSize = 100.0f;
    return o;
}

std::set<std::string> keysOf(const Value& v) {
    std::set<std::string> keys;
    for (const auto& [key, child] : v.asObject()) keys.insert(key);
    return keys;
}

const Array& glyphList(const Value& result, const char* category) {
    return result.find("glyphs")->find(category)->asArray();
}

class FailingWordLists : public WordListSource {
public:
    Result<std::vector<std::string>> words(const std::string& script) override {
        if (script == "Latin") {
            return Err<std::vector<std::string>>("corrupt list");
        }
        return Ok(std::vector<std::string>{});
    }
};

} // namespace

//=============================================================================
// Whole runs
//=============================================================================

suite font_differ_run_tests = [] {
    "identical fonts produce empty domains"_test = [] {
        FakeFont a, b;
        addTables(a);
        addTables(b);
        addLatin(a);
        addLatin(b);
        MemoryWordLists lists;
        lists.add("Latin", {"AB", "BA", "A B"});

        FontDiffer differ(a, b, options(), &lists);
        auto result = differ.run();
        expect(result.has_value() >> fatal) << error_msg(result);

        expect(keysOf(*result) == std::set<std::string>{"tables", "glyphs", "words"});
        expect(!result->find("tables")->isSomething());
        expect(glyphList(*result, "missing").empty());
        expect(glyphList(*result, "new").empty());
        expect(glyphList(*result, "modified").empty());
        expect(!result->find("words")->isSomething());
    };

    "one changed field gives one table entry"_test = [] {
        FakeFont a, b;
        addTables(a, 800);
        addTables(b, 850);
        addLatin(a);
        addLatin(b);

        FontDiffer differ(a, b, options());
        auto result = differ.run();
        expect(result.has_value() >> fatal);

        const Value& tables = *result->find("tables");
        expect(keysOf(tables) == std::set<std::string>{"hhea"});
        const Value& hhea = *tables.find("hhea");
        expect(keysOf(hhea) == std::set<std::string>{"ascender"});
        expect(*hhea.find("ascender") == leafPair(800, 850));
    };

    "removed character is missing"_test = [] {
        FakeFont a, b;
        addTables(a);
        addTables(b);
        addLatin(a);
        addLatin(b);
        b.removeCodepoint('A');

        FontDiffer differ(a, b, options());
        auto result = differ.run();
        expect(result.has_value() >> fatal);

        const Array& missing = glyphList(*result, "missing");
        expect((missing.size() == 1_u) >> fatal);
        const Value& entry = missing[0];
        expect(entry.find("string")->asString() == "A");
        expect(entry.find("unicode")->asString() == "U+0041");
        expect(entry.find("name")->asString() == "LATIN CAPITAL LETTER A");
        expect(entry.find("percent")->asNumber() == 100.0_d);
        expect(entry.find("category")->asString() == "missing");

        expect(glyphList(*result, "new").empty());
        expect(glyphList(*result, "modified").empty()) << "B is drawn the same in both";
    };

    "stroke change shows up in words"_test = [] {
        FakeFont a, b;
        addTables(a);
        addTables(b);
        addLatin(a, 300.0f);
        addLatin(b, 310.0f);
        MemoryWordLists lists;
        lists.add("Latin", {"AB", "XY"});

        FontDiffer differ(a, b, options(), &lists);
        auto result = differ.run();
        expect(result.has_value() >> fatal);

        const Value& words = *result->find("words");
        expect(keysOf(words) == std::set<std::string>{"Latin"});
        const Array& latin = words.find("Latin")->asArray();
        expect((latin.size() == 1_u) >> fatal) << "XY is rendered by neither font";

        const Value& entry = latin[0];
        expect(entry.find("word")->asString() == "AB");
        expect(entry.find("buffer_a")->asString() == "gid=1,position=0,0|gid=2,position=0,0");
        expect(entry.find("buffer_b")->asString() == "gid=1,position=0,0|gid=2,position=0,0");
        expect(entry.find("percent")->asNumber() > 0.0);
        expect(entry.find("percent")->asNumber() < 100.0);

        const Array& modified = glyphList(*result, "modified");
        expect((modified.size() == 1_u) >> fatal);
        expect(modified[0].find("unicode")->asString() == "U+0041");
        expect(modified[0].find("category")->asString() == "modified");
    };

    "disabled domains are left out"_test = [] {
        FakeFont a, b;
        addTables(a);
        addTables(b);

        DiffOptions o = options();
        o.glyphs = false;
        o.words = false;
        FontDiffer differ(a, b, o);
        auto result = differ.run();
        expect(result.has_value() >> fatal);
        expect(keysOf(*result) == std::set<std::string>{"tables"});

        o.tables = false;
        FontDiffer nothing(a, b, o);
        auto empty = nothing.run();
        expect(empty.has_value() >> fatal);
        expect(!empty->isSomething());
    };
};

//=============================================================================
// Tables
//=============================================================================

suite font_differ_table_tests = [] {
    "table on one side only"_test = [] {
        FakeFont a, b;
        addTables(a);
        addTables(b);
        a.setTable("DSIG", Value::object({{"version", 1}}));
        b.setTable("STAT", Value(Object{}));

        FontDiffer differ(a, b, options());
        Value tables = differ.diffTables();
        expect(keysOf(tables) == std::set<std::string>{"DSIG", "STAT"});
        expect(*tables.find("DSIG") == leafPair(Value::object({{"version", 1}}), Value()));
        expect(*tables.find("STAT") == leafPair(Value(), Value(Object{})))
            << "an empty table present on one side is still reported";
    };

    "decode failure becomes an error leaf"_test = [] {
        FakeFont a, b;
        addTables(a);
        addTables(b);
        a.setTableError("glyf", "truncated");
        b.setTable("glyf", Value::object({{"count", 3}}));

        FontDiffer differ(a, b, options());
        Value tables = differ.diffTables();
        const Value* glyf = tables.find("glyf");
        expect((glyf != nullptr) >> fatal);
        expect(isErrorLeaf(*glyf));
        const std::string& message = glyf->find("error")->asString();
        expect(message.find("old font") != std::string::npos);
        expect(message.find("truncated") != std::string::npos);
        expect(keysOf(tables) == std::set<std::string>{"glyf"});
    };

    "failures on both sides are both reported"_test = [] {
        FakeFont a, b;
        a.setTableError("CFF ", "bad charstring");
        b.setTableError("CFF ", "bad index");

        FontDiffer differ(a, b, options());
        Value tables = differ.diffTables();
        const std::string& message = tables.find("CFF ")->find("error")->asString();
        expect(message.find("bad charstring") != std::string::npos);
        expect(message.find("bad index") != std::string::npos);
    };

    "table diff needs no rendering"_test = [] {
        FakeFont a, b;
        addTables(a, 700);
        addTables(b, 750);
        FontDiffer differ(a, b, options());
        expect(differ.diffTables().isSomething());
        expect(a.glyphLoads() == 0_i);
        expect(a.shaper() == nullptr);
    };
};

//=============================================================================
// Glyphs
//=============================================================================

suite font_differ_glyph_tests = [] {
    "added character is new"_test = [] {
        FakeFont a, b;
        addLatin(a);
        addLatin(b);
        b.addRectGlyph('C', 50, 0, 450, 700, 500);

        FontDiffer differ(a, b, options());
        auto glyphs = differ.diffGlyphs();
        expect(glyphs.has_value() >> fatal);
        const Array& added = glyphs->find("new")->asArray();
        expect((added.size() == 1_u) >> fatal);
        expect(added[0].find("unicode")->asString() == "U+0043");
        expect(added[0].find("category")->asString() == "new");
        expect(added[0].find("percent")->asNumber() == 100.0_d);
    };

    "entries follow codepoint order"_test = [] {
        FakeFont a, b;
        addLatin(a);
        a.addRectGlyph('Z', 50, 0, 450, 700, 500);
        b.addBlankGlyph(' ', 250);

        FontDiffer differ(a, b, options());
        auto glyphs = differ.diffGlyphs();
        expect(glyphs.has_value() >> fatal);
        const Array& missing = glyphs->find("missing")->asArray();
        expect((missing.size() == 3_u) >> fatal);
        expect(missing[0].find("unicode")->asString() == "U+0041");
        expect(missing[1].find("unicode")->asString() == "U+0042");
        expect(missing[2].find("unicode")->asString() == "U+005A");
    };

    "threshold filters modified glyphs only"_test = [] {
        FakeFont a, b;
        addLatin(a, 300.0f);
        addLatin(b, 310.0f);
        b.removeCodepoint('B');

        // One extra 50 px column on a 50x120 canvas: 0.833%
        DiffOptions high = options();
        high.glyphThreshold = 1.0;
        FontDiffer strict(a, b, high);
        auto filtered = strict.diffGlyphs();
        expect(filtered.has_value() >> fatal);
        expect(filtered->find("modified")->asArray().empty());
        expect(filtered->find("missing")->asArray().size() == 1_u);

        DiffOptions low = options();
        low.glyphThreshold = 0.5;
        FontDiffer loose(a, b, low);
        auto kept = loose.diffGlyphs();
        expect(kept.has_value() >> fatal);
        expect((kept->find("modified")->asArray().size() == 1_u) >> fatal);
        double percent = kept->find("modified")->asArray()[0].find("percent")->asNumber();
        expect(percent > 0.83 && percent < 0.84);
    };

    "glyph that fails to load in the new font is missing"_test = [] {
        FakeFont a, b;
        addLatin(a);
        addLatin(b);
        b.failGlyph(2);

        FontDiffer differ(a, b, options());
        auto glyphs = differ.diffGlyphs();
        expect(glyphs.has_value() >> fatal);
        const Array& missing = glyphs->find("missing")->asArray();
        expect((missing.size() == 1_u) >> fatal);
        expect(missing[0].find("unicode")->asString() == "U+0042");
    };

    "codepoint neither font can shape is skipped"_test = [] {
        FakeFont a, b;
        addLatin(a);
        addLatin(b);
        a.addUnshapedCodepoint('Q');
        b.addUnshapedCodepoint('Q');

        FontDiffer differ(a, b, options());
        auto glyphs = differ.diffGlyphs();
        expect(glyphs.has_value() >> fatal);
        expect(glyphs->find("missing")->asArray().empty());
        expect(glyphs->find("new")->asArray().empty());
    };
};

//=============================================================================
// Words
//=============================================================================

suite font_differ_word_tests = [] {
    "repeated layouts are compared once"_test = [] {
        FakeFont a, b;
        addLatin(a, 300.0f);
        addLatin(b, 310.0f);
        MemoryWordLists lists;
        lists.add("Latin", {"AB", "AB", "BA", "AB"});

        FontDiffer differ(a, b, options(), &lists);
        auto words = differ.diffWords();
        expect(words.has_value() >> fatal);
        const Array& latin = words->find("Latin")->asArray();
        expect((latin.size() == 2_u) >> fatal);
        expect(latin[0].find("word")->asString() == "AB");
        expect(latin[1].find("word")->asString() == "BA");
    };

    "word threshold"_test = [] {
        FakeFont a, b;
        addLatin(a, 300.0f);
        addLatin(b, 310.0f);
        MemoryWordLists lists;
        lists.add("Latin", {"AB"});

        DiffOptions o = options();
        o.wordThreshold = 50.0;
        FontDiffer differ(a, b, o, &lists);
        auto words = differ.diffWords();
        expect(words.has_value() >> fatal);
        expect(!words->isSomething());
    };

    "word rendered by one font only is skipped"_test = [] {
        FakeFont a, b;
        addLatin(a);
        addLatin(b);
        b.removeCodepoint('B');
        MemoryWordLists lists;
        lists.add("Latin", {"AB"});

        FontDiffer differ(a, b, options(), &lists);
        auto words = differ.diffWords();
        expect(words.has_value() >> fatal);
        expect(!words->isSomething());
    };

    "failing word list skips its script"_test = [] {
        FakeFont a, b;
        addLatin(a, 300.0f);
        addLatin(b, 310.0f);
        FailingWordLists lists;

        FontDiffer differ(a, b, options(), &lists);
        auto words = differ.diffWords();
        expect(words.has_value() >> fatal);
        expect(!words->isSomething());
    };

    "no word lists"_test = [] {
        FakeFont a, b;
        addLatin(a, 300.0f);
        addLatin(b, 310.0f);
        FontDiffer differ(a, b, options());
        auto words = differ.diffWords();
        expect(words.has_value() >> fatal);
        expect(!words->isSomething());
    };

    "right-to-left script shapes with its direction"_test = [] {
        FakeFont a, b;
        a.addRectGlyph(0x0627, 50, 0, 150, 700, 200);
        b.addRectGlyph(0x0627, 50, 0, 170, 700, 200);
        // ALEF ALEF
        MemoryWordLists lists;
        lists.add("Arabic", {"\xD8\xA7\xD8\xA7"});

        FontDiffer differ(a, b, options(), &lists);
        auto words = differ.diffWords();
        expect(words.has_value() >> fatal);
        expect(keysOf(*words) == std::set<std::string>{"Arabic"});
        expect(a.shaper()->lastDirection() == Direction::RightToLeft);
        expect(a.shaper()->lastScript() == "Arab");
    };

    "scripts of either font are visited"_test = [] {
        FakeFont a, b;
        addLatin(a);
        addLatin(b);
        b.addRectGlyph(0x0627, 50, 0, 150, 700, 200);
        MemoryWordLists lists;
        lists.add("Arabic", {"\xD8\xA7"});

        FontDiffer differ(a, b, options(), &lists);
        auto words = differ.diffWords();
        expect(words.has_value() >> fatal);
        expect(!words->isSomething()) << "only the new font renders alef";
        expect(b.shaper()->lastScript() != "Arab") << "old font fails before the new one shapes";
    };
};

suite diff_options_tests = [] {
    "defaults"_test = [] {
        DiffOptions o;
        expect(o.tables && o.glyphs && o.words);
        expect(o.fontSize == 40.0_f);
        expect(o.glyphThreshold == 0.0_d);
        expect(o.wordThreshold == 0.0_d);
    };
};
