#include "report.h"

#include <fontdiff/diff.h>

#include <cstdio>
#include <string>

namespace fontdiff::tools {

namespace {

constexpr const char* GREEN = "\033[32m";
constexpr const char* RED = "\033[31m";
constexpr const char* ITALIC = "\033[3m";
constexpr const char* RESET = "\033[0m";

std::string paint(const std::string& text, const char* code, const ReportStyle& style) {
    if (!style.color) return text;
    return code + text + RESET;
}

std::string absent(const char* code, const ReportStyle& style) {
    if (!style.color) return "<absent>";
    return std::string(code) + ITALIC + "<absent>" + RESET;
}

std::string percent(const Value& entry) {
    const Value* p = entry.find("percent");
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.3f%%", p && p->isNumber() ? p->asNumber() : 0.0);
    return buffer;
}

std::string stringField(const Value& entry, const char* key) {
    const Value* v = entry.find(key);
    return v && v->isString() ? v->asString() : "";
}

void printFields(std::ostream& out, const Object& fields, int indent,
                 const ReportStyle& style) {
    for (const auto& [field, node] : fields) {
        out << std::string(static_cast<size_t>(indent) * 2, ' ');
        if (field == "error" && node.isString()) {
            out << paint(node.asString(), RED, style) << "\n";
            continue;
        }
        if (isLeafPair(node)) {
            const Array& lr = node.asArray();
            out << field << ": " << formatLeaf(lr[0], lr[1], style) << "\n";
        } else if (node.isObject()) {
            out << field << ":\n";
            printFields(out, node.asObject(), indent + 1, style);
        }
    }
}

void printTables(std::ostream& out, const Object& tables, const ReportStyle& style) {
    for (const auto& [tag, node] : tables) {
        if (!node.isSomething()) continue;
        out << "\n# " << tag << "\n";

        if (isLeafPair(node)) {
            const Value& left = node.asArray()[0];
            const Value& right = node.asArray()[1];
            if (style.succinct && left.isSomething() && !right.isSomething()) {
                out << "Table was present in old font but absent in new font\n";
            } else if (style.succinct && right.isSomething() && !left.isSomething()) {
                out << "Table was present in new font but absent in old font\n";
            } else {
                out << "Old font had: " << left.toJson() << "\n";
                out << "New font had: " << right.toJson() << "\n";
            }
        } else if (node.isObject()) {
            printFields(out, node.asObject(), 0, style);
        } else {
            out << "Unexpected diff format: " << node.toJson() << "\n";
        }
    }
}

void printGlyphList(std::ostream& out, const Value* list, const char* heading) {
    if (!list || !list->isSomething()) return;
    out << "\n" << heading << ":\n";
    for (const auto& glyph : list->asArray()) {
        out << "  - " << stringField(glyph, "string")
            << " (" << stringField(glyph, "unicode") << ": " << stringField(glyph, "name")
            << ") " << percent(glyph) << "\n";
    }
}

} // namespace

std::string formatLeaf(const Value& left, const Value& right, const ReportStyle& style) {
    if (style.succinct && left.isSomething() && !right.isSomething()) {
        return paint(left.toJson(), GREEN, style) + " => " + absent(RED, style);
    }
    if (style.succinct && right.isSomething() && !left.isSomething()) {
        return absent(GREEN, style) + " => " + paint(right.toJson(), RED, style);
    }
    return paint(left.toJson(), GREEN, style) + " => " + paint(right.toJson(), RED, style);
}

void printReport(std::ostream& out, const Value& diff, const ReportStyle& style) {
    if (const Value* tables = diff.find("tables"); tables && tables->isObject()) {
        printTables(out, tables->asObject(), style);
    }

    if (const Value* glyphs = diff.find("glyphs"); glyphs && glyphs->isObject()) {
        out << "\n# Glyphs\n";
        printGlyphList(out, glyphs->find("missing"), "Missing glyphs");
        printGlyphList(out, glyphs->find("new"), "New glyphs");
        printGlyphList(out, glyphs->find("modified"), "Modified glyphs");
    }

    if (const Value* words = diff.find("words"); words && words->isObject()) {
        out << "\n# Words\n";
        for (const auto& [script, entries] : words->asObject()) {
            out << "\n## " << script << "\n";
            if (!entries.isArray()) continue;
            for (const auto& entry : entries.asArray()) {
                out << "  - " << stringField(entry, "word") << " (" << percent(entry) << ")\n";
            }
        }
    }
}

} // namespace fontdiff::tools
