#include <fontdiff/wordlists.h>

#include <brotli/decode.h>
#include <ytrace/ytrace.hpp>

#include <fstream>
#include <sstream>

namespace fontdiff {

namespace fs = std::filesystem;

Result<std::string> brotliDecompress(const std::string& compressed) {
    BrotliDecoderState* state = BrotliDecoderCreateInstance(nullptr, nullptr, nullptr);
    if (!state) {
        return Err<std::string>("brotli: cannot create decoder");
    }

    std::string out;
    uint8_t buffer[64 * 1024];

    size_t availIn = compressed.size();
    const uint8_t* nextIn = reinterpret_cast<const uint8_t*>(compressed.data());

    BrotliDecoderResult result = BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT;
    while (result == BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT) {
        size_t availOut = sizeof(buffer);
        uint8_t* nextOut = buffer;
        result = BrotliDecoderDecompressStream(state, &availIn, &nextIn,
                                               &availOut, &nextOut, nullptr);
        out.append(reinterpret_cast<const char*>(buffer), sizeof(buffer) - availOut);
    }

    std::string error;
    if (result == BROTLI_DECODER_RESULT_NEEDS_MORE_INPUT) {
        error = "brotli: truncated stream";
    } else if (result == BROTLI_DECODER_RESULT_ERROR) {
        error = std::string("brotli: ") +
                BrotliDecoderErrorString(BrotliDecoderGetErrorCode(state));
    } else if (availIn != 0) {
        error = "brotli: trailing data after stream";
    }
    BrotliDecoderDestroyInstance(state);

    if (!error.empty()) {
        return Err<std::string>(error);
    }
    return Ok(std::move(out));
}

std::vector<std::string> splitWords(const std::string& text) {
    std::vector<std::string> words;
    std::istringstream ss(text);
    std::string line;
    while (std::getline(ss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) words.push_back(std::move(line));
    }
    return words;
}

Result<std::vector<std::string>> MemoryWordLists::words(const std::string& script) {
    auto it = _lists.find(script);
    if (it == _lists.end()) return Ok(std::vector<std::string>{});
    return Ok(it->second);
}

//=============================================================================
// DirectoryWordLists
//=============================================================================

static Result<std::string> readFile(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Err<std::string>("cannot open " + path.string());
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Ok(ss.str());
}

class DirectoryWordListsImpl : public DirectoryWordLists {
public:
    explicit DirectoryWordListsImpl(fs::path directory) : _directory(std::move(directory)) {}

    Result<void> init() {
        std::error_code ec;
        if (!fs::is_directory(_directory, ec)) {
            return Err("word list directory not found: " + _directory.string());
        }
        return Ok();
    }

    Result<std::vector<std::string>> words(const std::string& script) override {
        auto it = _cache.find(script);
        if (it != _cache.end()) return Ok(it->second);

        auto res = load(script);
        if (!res) {
            return Err<std::vector<std::string>>("word list " + script, res);
        }
        ydebug("Loaded {} words for {}", res->size(), script);
        _cache.emplace(script, *res);
        return res;
    }

private:
    Result<std::vector<std::string>> load(const std::string& script) const {
        std::error_code ec;

        fs::path compressed = _directory / (script + ".txt.br");
        if (fs::exists(compressed, ec)) {
            auto data = readFile(compressed);
            if (!data) return Err<std::vector<std::string>>("read failed", data);
            auto text = brotliDecompress(*data);
            if (!text) return Err<std::vector<std::string>>(compressed.string(), text);
            return Ok(splitWords(*text));
        }

        fs::path plain = _directory / (script + ".txt");
        if (fs::exists(plain, ec)) {
            auto text = readFile(plain);
            if (!text) return Err<std::vector<std::string>>("read failed", text);
            return Ok(splitWords(*text));
        }

        return Ok(std::vector<std::string>{});
    }

    fs::path _directory;
    std::map<std::string, std::vector<std::string>> _cache;
};

Result<WordListSource::Ptr> DirectoryWordLists::create(const fs::path& directory) {
    auto impl = std::make_shared<DirectoryWordListsImpl>(directory);
    if (auto res = impl->init(); !res) {
        return Err<Ptr>("DirectoryWordLists creation failed", res);
    }
    return Ok(Ptr(std::move(impl)));
}

} // namespace fontdiff
