#include <catch2/catch_test_macros.hpp>
#include "codemap.hpp"
#include "test_support.hpp"

namespace {

CodeMapOptions optionsFor(const fs::path& root) {
    CodeMapOptions options;
    options.inputDir = root;
    return options;
}

void writeProject(TempProject& project) {
    project.write("app/main.py",
        "from .service import process\n"
        "\n"
        "def main():\n"
        "    return process([1, 2])\n");
    project.write("app/service.py",
        "def process(items):\n"
        "    return validate(items)\n"
        "\n"
        "def validate(items):\n"
        "    return items\n");
    project.write("web/index.ts", "import { api } from './api';\nexport function boot() { api(); }\n");
    project.write("web/api.ts", "export const api = () => 1;\n");
    project.write("tests/test_service.py", "from ..app.service import process\n");
    project.write("README.md", "# Demo\n");
}

} // namespace

TEST_CASE("CodeMap summarizes the index", "[CodeMap]") {
    TempProject project("codemap_summary");
    writeProject(project);
    CodeMap codemap(optionsFor(project.root()));

    IndexSummary summary = codemap.summarizeIndex();

    REQUIRE(summary.error.empty());
    REQUIRE(summary.files == 5);
    REQUIRE(summary.skippedFiles == 0);
    REQUIRE(summary.importEdges == 3);
    REQUIRE(summary.imports == 3);
    REQUIRE(summary.symbols >= 5);
}

TEST_CASE("CodeMap answers symbol and dependency queries", "[CodeMap]") {
    TempProject project("codemap_queries");
    writeProject(project);
    CodeMap codemap(optionsFor(project.root()));

    SECTION("Symbol lookup") {
        SymbolLookup lookup = codemap.findSymbol("process");
        REQUIRE(lookup.error.empty());
        REQUIRE(lookup.locations.size() == 1);
        REQUIRE(lookup.locations[0].relativePath == "app/service.py");

        REQUIRE(codemap.findSymbol("nothing").locations.empty());
    }

    SECTION("Dependencies accept ./ prefixed paths") {
        FileDependencies deps = codemap.fileDependencies("./app/service.py");
        REQUIRE(deps.error.empty());
        REQUIRE(deps.file == "app/service.py");
        REQUIRE(deps.importedBy == std::vector<std::string>{"app/main.py", "tests/test_service.py"});
    }

    SECTION("Dependencies accept absolute paths inside the root") {
        FileDependencies deps = codemap.fileDependencies((project.root() / "web" / "index.ts").string());
        REQUIRE(deps.imports == std::vector<std::string>{"web/api.ts"});
    }

    SECTION("Unknown files are reported in the result") {
        FileDependencies deps = codemap.fileDependencies("missing.py");
        REQUIRE(deps.error == "File not found in index: missing.py");
    }

    SECTION("Impact") {
        ChangeImpact impact = codemap.impact("app/service.py");
        REQUIRE(impact.totalAffected == 2);
        REQUIRE(impact.risk == RiskLevel::Medium);
    }
}

TEST_CASE("CodeMap runs call analysis", "[CodeMap]") {
    TempProject project("codemap_calls");
    writeProject(project);
    CodeMap codemap(optionsFor(project.root()));

    CallGraphResult graph = codemap.callGraph("process", CallDirection::Both);
    REQUIRE(graph.error.empty());
    REQUIRE(graph.callers.size() == 1);
    REQUIRE(graph.callers[0].function == "main");
    REQUIRE(graph.callees.size() == 1);
    REQUIRE(graph.callees[0].function == "validate");

    FlowTrace trace = codemap.traceFlow("main", 5);
    REQUIRE(trace.steps.size() == 3);
    REQUIRE(trace.steps[2].function == "validate");
    REQUIRE(trace.steps[2].depth == 2);

    UsageReport usages = codemap.findUsages("validate");
    REQUIRE(usages.usages.size() == 2);

    REQUIRE(codemap.callGraph("ghost", CallDirection::Callers).error == "Symbol 'ghost' not found");
}

TEST_CASE("CodeMap parses single files", "[CodeMap]") {
    TempProject project("codemap_parse");
    writeProject(project);
    project.write("broken.py", "def broken(:\n");
    CodeMap codemap(optionsFor(project.root()));

    ParseReport report = codemap.parseFile("web/index.ts");
    REQUIRE(report.error.empty());
    REQUIRE(report.parsed.has_value());
    REQUIRE(report.parsed->language == Language::TypeScript);

    REQUIRE(codemap.parseFile("nope.py").error == "File not found: nope.py");
    REQUIRE(codemap.parseFile("broken.py").error == "Could not parse broken.py");
    REQUIRE(codemap.parseFile("README.md").error == "Could not parse README.md");
}

TEST_CASE("CodeMap compresses and maps the project", "[CodeMap]") {
    TempProject project("codemap_compress");
    writeProject(project);
    CodeMap codemap(optionsFor(project.root()));

    CompressionResult compressed = codemap.compress({"./web/api.ts"}, CompressionMode::Full);
    REQUIRE(compressed.error.empty());
    REQUIRE(compressed.content == "### web/api.ts\n```\nexport const api = () => 1;\n```\n");

    RepoMapReport map = codemap.repoMap();
    REQUIRE(map.error.empty());
    REQUIRE(map.content.rfind("# Repository Map: " + project.root().filename().string() + "\n", 0) == 0);
    REQUIRE(map.content.find("## app/\n") != std::string::npos);
}

TEST_CASE("CodeMap retrieves context for questions and files", "[CodeMap]") {
    TempProject project("codemap_retrieval");
    writeProject(project);
    CodeMap codemap(optionsFor(project.root()));

    SmartContext context = codemap.smartContext("Where is process defined?");
    REQUIRE(context.error.empty());
    REQUIRE(context.keywords == std::vector<std::string>{"process", "defined"});
    REQUIRE(context.files.front().file == "app/service.py");

    SearchResults results = codemap.search("validate");
    REQUIRE(results.hits.front().symbolMatch);
    REQUIRE(results.hits.front().exact);
    REQUIRE(results.hits.front().file == "app/service.py");

    FileContext file = codemap.fileContext("./app/service.py");
    REQUIRE(file.error.empty());
    REQUIRE(file.file == "app/service.py");
    REQUIRE(file.related.size() == 2);
    REQUIRE(file.related[0].relationship == "used_by");

    REQUIRE(codemap.fileContext("nope.py").error == "File not found: nope.py");
}

TEST_CASE("CodeMap honors include and exclude patterns", "[CodeMap]") {
    TempProject project("codemap_patterns");
    writeProject(project);

    CodeMapOptions options = optionsFor(project.root());
    options.excludePatterns = "tests/";
    CodeMap excluding(options);
    REQUIRE(excluding.summarizeIndex().files == 4);

    options.excludePatterns.clear();
    options.includePatterns = "web/**";
    CodeMap including(options);
    REQUIRE(including.summarizeIndex().files == 2);

    ScanReport scan = including.scan();
    REQUIRE(scan.files.size() == 2);
}

TEST_CASE("CodeMap reports a missing root in every result", "[CodeMap]") {
    CodeMap codemap(optionsFor("/non/existent/project"));

    REQUIRE_THROWS_AS(codemap.buildIndex(), std::runtime_error);

    const std::string expected = "Project path does not exist: /non/existent/project";
    REQUIRE(codemap.summarizeIndex().error == expected);
    REQUIRE(codemap.findSymbol("x").error == expected);
    REQUIRE(codemap.impact("a.py").error == expected);
    REQUIRE(codemap.scan().error == expected);
    REQUIRE(codemap.compress({"a.py"}, CompressionMode::Smart).error == expected);
    REQUIRE(codemap.repoMap().error == expected);
    REQUIRE(codemap.smartContext("where is main").error == expected);
    REQUIRE(codemap.fileContext("a.py").error == expected);
}

TEST_CASE("CodeMap normalizes user supplied paths", "[CodeMap]") {
    TempProject project("codemap_paths");
    CodeMap codemap(optionsFor(project.root()));

    REQUIRE(codemap.normalizeFilePath("./src/a.py") == "src/a.py");
    REQUIRE(codemap.normalizeFilePath("src/../lib/b.ts") == "lib/b.ts");
    REQUIRE(codemap.normalizeFilePath((project.root() / "pkg" / "c.py").string()) == "pkg/c.py");
}
