#pragma once

#include <fontdiff/font-source.h>
#include <fontdiff/renderer.h>
#include <fontdiff/result.hpp>
#include <fontdiff/value.h>
#include <fontdiff/wordlists.h>

#include <memory>

namespace fontdiff {

class Config;

// Which domains run and how entries are filtered
struct DiffOptions {
    bool tables = true;
    bool glyphs = true;
    bool words = true;
    float fontSize = 40.0f;
    // Modified entries are kept only when percent > threshold
    double glyphThreshold = 0.0;
    double wordThreshold = 0.0;

    static DiffOptions fromConfig(const Config& config);
};

/**
 * FontDiffer - compares an old font (a) with a new one (b).
 *
 * Output of run():
 *
 *   {
 *     "tables": { tag: diff node, ... },
 *     "glyphs": { "missing": [entry...], "new": [...], "modified": [...] },
 *     "words":  { script: [ {word, buffer_a, buffer_b, percent}, ... ] }
 *   }
 *
 * Only the enabled domains appear. Table tags and codepoints are visited in
 * sorted order, words in word-list order, so output is deterministic.
 * Both fonts must already be at their final location.
 */
class FontDiffer {
public:
    FontDiffer(const FontSource& fontA, const FontSource& fontB, DiffOptions options,
               WordListSource* wordLists = nullptr);

    FontDiffer(const FontDiffer&) = delete;
    FontDiffer& operator=(const FontDiffer&) = delete;

    Value diffTables() const;

    // Err only when a shaper cannot be created for either font
    Result<Value> diffGlyphs();
    Result<Value> diffWords();

    Result<Value> run();

    const DiffOptions& options() const { return _options; }

private:
    Result<void> ensureRenderers();

    const FontSource& _fontA;
    const FontSource& _fontB;
    DiffOptions _options;
    WordListSource* _wordLists;
    std::unique_ptr<Renderer> _rendererA;
    std::unique_ptr<Renderer> _rendererB;
};

} // namespace fontdiff
