#include <fontdiff/font-differ.h>
#include <fontdiff/compare.h>
#include <fontdiff/config.h>
#include <fontdiff/diff.h>
#include <fontdiff/unicode.h>

#include <ytrace/ytrace.hpp>

#include <set>
#include <unordered_set>

namespace fontdiff {

DiffOptions DiffOptions::fromConfig(const Config& config) {
    DiffOptions options;
    options.tables = config.get<bool>(Config::KEY_DIFF_TABLES, true);
    options.glyphs = config.get<bool>(Config::KEY_DIFF_GLYPHS, true);
    options.words = config.get<bool>(Config::KEY_DIFF_WORDS, true);
    options.fontSize = config.get<float>(Config::KEY_FONT_SIZE, 40.0f);
    options.glyphThreshold = config.get<double>(Config::KEY_GLYPH_THRESHOLD, 0.0);
    options.wordThreshold = config.get<double>(Config::KEY_WORD_THRESHOLD, 0.0);
    return options;
}

FontDiffer::FontDiffer(const FontSource& fontA, const FontSource& fontB, DiffOptions options,
                       WordListSource* wordLists)
    : _fontA(fontA), _fontB(fontB), _options(options), _wordLists(wordLists) {}

Result<void> FontDiffer::ensureRenderers() {
    if (_rendererA && _rendererB) return Ok();

    auto shaperA = _fontA.createShaper();
    if (!shaperA) return Err("cannot shape with old font", shaperA);
    auto shaperB = _fontB.createShaper();
    if (!shaperB) return Err("cannot shape with new font", shaperB);

    _rendererA = std::make_unique<Renderer>(_fontA, *shaperA, _options.fontSize);
    _rendererB = std::make_unique<Renderer>(_fontB, *shaperB, _options.fontSize);
    return Ok();
}

//=============================================================================
// Tables
//=============================================================================

Value FontDiffer::diffTables() const {
    std::set<std::string> tags;
    auto namesA = _fontA.tableNames();
    auto namesB = _fontB.tableNames();
    std::set<std::string> inA(namesA.begin(), namesA.end());
    std::set<std::string> inB(namesB.begin(), namesB.end());
    tags.insert(inA.begin(), inA.end());
    tags.insert(inB.begin(), inB.end());

    Object tables;
    for (const auto& tag : tags) {
        Value left;
        Value right;
        std::string errors;

        if (inA.count(tag)) {
            auto res = _fontA.decodeTable(tag);
            if (res) {
                left = std::move(*res);
            } else {
                errors = "old font: " + error_msg(res);
            }
        }
        if (inB.count(tag)) {
            auto res = _fontB.decodeTable(tag);
            if (res) {
                right = std::move(*res);
            } else {
                if (!errors.empty()) errors += "; ";
                errors += "new font: " + error_msg(res);
            }
        }

        if (!errors.empty()) {
            ywarn("Table '{}': {}", tag, errors);
            tables.insert(tag, errorLeaf(errors));
            continue;
        }

        // Absent on one side: always reported, whatever the other side holds
        if (!inA.count(tag) || !inB.count(tag)) {
            tables.insert(tag, leafPair(left, right));
            continue;
        }

        Value node = diff(left, right);
        if (node.isSomething()) {
            tables.insert(tag, std::move(node));
        }
    }

    ydebug("Table diff: {} of {} tables differ", tables.size(), tags.size());
    return Value(std::move(tables));
}

//=============================================================================
// Glyphs
//=============================================================================

Result<Value> FontDiffer::diffGlyphs() {
    if (auto res = ensureRenderers(); !res) {
        return Err<Value>("glyph diff", res);
    }

    std::set<uint32_t> codepoints(_fontA.codepoints().begin(), _fontA.codepoints().end());
    codepoints.insert(_fontB.codepoints().begin(), _fontB.codepoints().end());

    Array missing;
    Array added;
    Array modified;

    for (uint32_t cp : codepoints) {
        std::string text = unicode::encodeUtf8(cp);
        auto a = _rendererA->render(Direction::LeftToRight, "", text);
        auto b = _rendererB->render(Direction::LeftToRight, "", text);

        auto comparison = compareRenderings(a, b);
        if (!comparison) continue;
        if (comparison->category == Category::Modified &&
            comparison->percent <= _options.glyphThreshold) {
            continue;
        }

        Object entry;
        entry.insert("string", text);
        entry.insert("unicode", unicode::formatCodepoint(cp));
        entry.insert("name", unicode::codepointName(cp));
        entry.insert("percent", comparison->percent);
        entry.insert("category", categoryName(comparison->category));

        switch (comparison->category) {
            case Category::Missing:  missing.emplace_back(std::move(entry)); break;
            case Category::New:      added.emplace_back(std::move(entry)); break;
            case Category::Modified: modified.emplace_back(std::move(entry)); break;
        }
    }

    yinfo("Glyph diff over {} codepoints: {} missing, {} new, {} modified",
          codepoints.size(), missing.size(), added.size(), modified.size());

    Object glyphs;
    glyphs.insert("missing", std::move(missing));
    glyphs.insert("new", std::move(added));
    glyphs.insert("modified", std::move(modified));
    return Ok(Value(std::move(glyphs)));
}

//=============================================================================
// Words
//=============================================================================

Result<Value> FontDiffer::diffWords() {
    if (auto res = ensureRenderers(); !res) {
        return Err<Value>("word diff", res);
    }

    Object words;
    if (!_wordLists) {
        ydebug("No word lists, skipping word diff");
        return Ok(Value(std::move(words)));
    }

    std::set<std::string> scripts = _fontA.supportedScripts();
    for (auto& script : _fontB.supportedScripts()) {
        scripts.insert(script);
    }

    for (const auto& script : scripts) {
        auto list = _wordLists->words(script);
        if (!list) {
            ywarn("Skipping {}: {}", script, error_msg(list));
            continue;
        }
        if (list->empty()) continue;

        std::string tag;
        Direction direction = Direction::LeftToRight;
        if (auto info = unicode::scriptInfo(script)) {
            tag = info->tag;
            direction = info->direction;
        }

        Array entries;
        std::unordered_set<std::string> seen;
        for (const auto& word : *list) {
            auto a = _rendererA->render(direction, tag, word);
            if (!a) continue;
            auto b = _rendererB->render(direction, tag, word);
            if (!b) continue;

            // Same glyphs at the same positions in both fonts as an earlier word
            if (!seen.insert(a->trace + "\n" + b->trace).second) continue;

            double percent = percentDifference(a->image, b->image);
            if (percent <= _options.wordThreshold) continue;

            Object entry;
            entry.insert("word", word);
            entry.insert("buffer_a", a->trace);
            entry.insert("buffer_b", b->trace);
            entry.insert("percent", percent);
            entries.emplace_back(std::move(entry));
        }

        ydebug("{}: {} words, {} differ", script, list->size(), entries.size());
        if (!entries.empty()) {
            words.insert(script, std::move(entries));
        }
    }

    return Ok(Value(std::move(words)));
}

Result<Value> FontDiffer::run() {
    Object result;
    if (_options.tables) {
        result.insert("tables", diffTables());
    }
    if (_options.glyphs) {
        auto glyphs = diffGlyphs();
        if (!glyphs) return glyphs;
        result.insert("glyphs", std::move(*glyphs));
    }
    if (_options.words) {
        auto words = diffWords();
        if (!words) return words;
        result.insert("words", std::move(*words));
    }
    return Ok(Value(std::move(result)));
}

} // namespace fontdiff
