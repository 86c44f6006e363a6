#include <catch2/catch_test_macros.hpp>
#include "context_compressor.hpp"
#include "test_support.hpp"

namespace {

std::string largePythonModule() {
    std::string content =
        "class Big:\n"
        "    def method(self, x):\n"
        "        return x\n";
    for (int i = 0; i < 495; ++i) {
        content += "value_" + std::to_string(i) + " = " + std::to_string(i) + "\n";
    }
    content += "def helper(a, b):\n    return a\n";
    return content;
}

std::string repeatedLines(const std::string& line, size_t count) {
    std::string content;
    for (size_t i = 0; i < count; ++i) {
        content += line;
    }
    return content;
}

} // namespace

TEST_CASE("Compression modes parse from text", "[ContextCompressor]") {
    REQUIRE(compressionModeFromString("full") == CompressionMode::Full);
    REQUIRE(compressionModeFromString("signatures") == CompressionMode::Signatures);
    REQUIRE(compressionModeFromString("smart") == CompressionMode::Smart);
    REQUIRE(compressionModeToString(CompressionMode::Signatures) == "signatures");
    REQUIRE_THROWS_AS(compressionModeFromString("tiny"), std::invalid_argument);
}

TEST_CASE("Smart mode keeps small files whole and summarizes large ones", "[ContextCompressor]") {
    TempProject project("compress_smart");
    project.write("small.py", "def small():\n    return 1\n");
    project.write("big.py", largePythonModule());

    ContextCompressor compressor(project.root());

    SECTION("Small file is emitted in full") {
        CompressionResult result = compressor.compress({"small.py"}, CompressionMode::Smart);
        REQUIRE(result.content == "### small.py\n```\ndef small():\n    return 1\n```\n");
        REQUIRE(result.filesIncluded == std::vector<std::string>{"small.py"});
        REQUIRE(result.estimatedTokens == result.content.size() / 4);
    }

    SECTION("Large file is reduced to signatures") {
        CompressionResult result = compressor.compress({"big.py"}, CompressionMode::Smart);
        REQUIRE(result.content ==
                "### big.py (signatures only)\n"
                "class Big:\n"
                "    def method(self, x)\n"
                "def helper(a, b)\n");
        REQUIRE(result.mode == CompressionMode::Smart);
    }

    SECTION("Sections are joined by a blank line") {
        CompressionResult result = compressor.compress({"small.py", "big.py"}, CompressionMode::Smart);
        REQUIRE(result.content.rfind("### small.py\n", 0) == 0);
        REQUIRE(result.content.find("```\n\n### big.py (signatures only)\n") != std::string::npos);
    }
}

TEST_CASE("Full and signature modes ignore file size", "[ContextCompressor]") {
    TempProject project("compress_modes");
    project.write("big.py", largePythonModule());
    project.write("web/api.ts", "export function get(url: string): Promise<string> {\n  return fetch(url);\n}\n");
    project.write("README.md", "# Title");

    ContextCompressor compressor(project.root());

    SECTION("Full mode copies content verbatim") {
        CompressionResult result = compressor.compress({"big.py"}, CompressionMode::Full);
        REQUIRE(result.content == "### big.py\n```\n" + largePythonModule() + "```\n");
    }

    SECTION("Missing trailing newline is added before the fence") {
        CompressionResult result = compressor.compress({"README.md"}, CompressionMode::Full);
        REQUIRE(result.content == "### README.md\n```\n# Title\n```\n");
    }

    SECTION("Signature mode uses the language keyword") {
        CompressionResult result = compressor.compress({"web/api.ts"}, CompressionMode::Signatures);
        REQUIRE(result.content ==
                "### web/api.ts (signatures only)\n"
                "function get(url: string): Promise<string>\n");
    }

    SECTION("Files without a parser can't be summarized") {
        CompressionResult result = compressor.compress({"README.md"}, CompressionMode::Signatures);
        REQUIRE(result.content == "### README.md (could not parse)\n");
    }
}

TEST_CASE("Missing and unparseable files get placeholder sections", "[ContextCompressor]") {
    TempProject project("compress_missing");
    project.write("broken.py", "def broken(:\n    pass\n");

    ContextCompressor compressor(project.root());

    CompressionResult result = compressor.compress({"ghost.py", "../outside.py", "broken.py"},
                                                   CompressionMode::Signatures);
    REQUIRE(result.content ==
            "### ghost.py (not found)\n"
            "\n"
            "### ../outside.py (not found)\n"
            "\n"
            "### broken.py (could not parse)\n");
    REQUIRE(result.filesIncluded.size() == 3);
    REQUIRE(result.omittedFiles.empty());
}

TEST_CASE("Token budget packs files greedily", "[ContextCompressor]") {
    TempProject project("compress_budget");
    const std::string body = repeatedLines("x = 1\n", 66);
    project.write("a.py", body);
    project.write("b.py", body);
    project.write("c.py", body);

    ContextCompressor compressor(project.root());

    SECTION("Files past the budget are omitted") {
        CompressionResult result = compressor.compress({"a.py", "b.py", "c.py"}, CompressionMode::Smart, 150);
        REQUIRE(result.filesIncluded == std::vector<std::string>{"a.py", "b.py"});
        REQUIRE(result.omittedFiles == std::vector<std::string>{"c.py"});
        REQUIRE(result.estimatedTokens == 206);
    }

    SECTION("A zero budget includes everything") {
        CompressionResult result = compressor.compress({"a.py", "b.py", "c.py"}, CompressionMode::Smart);
        REQUIRE(result.filesIncluded.size() == 3);
        REQUIRE(result.omittedFiles.empty());
    }

    SECTION("The first file is always included") {
        CompressionResult result = compressor.compress({"a.py", "b.py"}, CompressionMode::Full, 1);
        REQUIRE(result.filesIncluded == std::vector<std::string>{"a.py"});
        REQUIRE(result.omittedFiles == std::vector<std::string>{"b.py"});
    }
}

TEST_CASE("Token estimate divides characters", "[ContextCompressor]") {
    TempProject project("compress_tokens");

    ContextCompressor compressor(project.root());
    REQUIRE(compressor.estimateTokens("") == 0);
    REQUIRE(compressor.estimateTokens("abcdefgh") == 2);
    REQUIRE(compressor.estimateTokens("abc") == 0);

    CompressorOptions options;
    options.charsPerToken = 2;
    ContextCompressor halved(project.root(), options);
    REQUIRE(halved.estimateTokens("abcdefgh") == 4);
}
