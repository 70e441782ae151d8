#pragma once

#include <fontdiff/result.hpp>

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace fontdiff {

/**
 * WordListSource - per-script word corpora, keyed by Unicode script name
 * ("Latin", "Arabic"). A script without a list yields an empty vector.
 */
class WordListSource {
public:
    using Ptr = std::shared_ptr<WordListSource>;

    virtual ~WordListSource() = default;

    virtual Result<std::vector<std::string>> words(const std::string& script) = 0;
};

/**
 * DirectoryWordLists - reads <dir>/<Script>.txt.br (Brotli) or
 * <dir>/<Script>.txt, one word per line. Lists are loaded on first use and
 * kept for the lifetime of the object.
 */
class DirectoryWordLists : public WordListSource {
public:
    static Result<Ptr> create(const std::filesystem::path& directory);

    ~DirectoryWordLists() override = default;

protected:
    DirectoryWordLists() = default;
};

// Fixed in-memory lists
class MemoryWordLists : public WordListSource {
public:
    MemoryWordLists() = default;
    explicit MemoryWordLists(std::map<std::string, std::vector<std::string>> lists)
        : _lists(std::move(lists)) {}

    void add(const std::string& script, std::vector<std::string> words) {
        _lists[script] = std::move(words);
    }

    Result<std::vector<std::string>> words(const std::string& script) override;

private:
    std::map<std::string, std::vector<std::string>> _lists;
};

// Decompress a complete Brotli stream
Result<std::string> brotliDecompress(const std::string& compressed);

// Split on '\n', dropping '\r' and empty lines
std::vector<std::string> splitWords(const std::string& text);

} // namespace fontdiff
