#include <catch2/catch_test_macros.hpp>
#include "symbol_index.hpp"
#include "test_support.hpp"

namespace {

SymbolIndex buildFor(const TempProject& project) {
    PatternMatcher matcher = makeRepositoryMatcher(project.root());
    SymbolIndexBuilder builder(project.root(), matcher);
    return builder.build();
}

std::vector<std::string> symbolNames(const std::vector<Symbol>& symbols) {
    std::vector<std::string> names;
    for (const auto& symbol : symbols) {
        names.push_back(symbol.name);
    }
    return names;
}

} // namespace

TEST_CASE("SymbolIndexBuilder links a relative import", "[SymbolIndex]") {
    TempProject project("index_two_files");
    project.write("a.py", "from .b import foo\n\ndef main():\n    foo()\n");
    project.write("b.py", "def foo():\n    pass\n");

    SymbolIndex index = buildFor(project);

    REQUIRE(index.files.size() == 2);
    REQUIRE(index.importGraph.importsOf("a.py") == std::set<std::string>{"b.py"});
    REQUIRE(index.importGraph.importedBy("b.py") == std::set<std::string>{"a.py"});
    REQUIRE(index.importGraph.importsOf("b.py").empty());

    auto foo = findSymbol(index, "foo");
    REQUIRE(foo.size() == 1);
    REQUIRE(foo[0].relativePath == "b.py");
    REQUIRE(foo[0].symbol.kind == SymbolKind::Function);

    REQUIRE(index.fileLanguages.at("a.py") == Language::Python);
    REQUIRE(index.importsByFile.at("a.py").size() == 1);
}

TEST_CASE("Import graph directions mirror each other", "[SymbolIndex]") {
    TempProject project("index_symmetry");
    project.write("app/main.py", "from .service import run\nfrom .models import User\nimport os\n");
    project.write("app/service.py", "from .models import User\n\ndef run():\n    pass\n");
    project.write("app/models.py", "class User:\n    pass\n");
    project.write("web/index.ts", "import { api } from './api';\nimport React from 'react';\n");
    project.write("web/api.ts", "import { User } from '../shared/types';\nexport const api = () => 1;\n");
    project.write("shared/types.ts", "export interface User { id: number }\n");

    SymbolIndex index = buildFor(project);

    for (const auto& [from, targets] : index.importGraph.forward()) {
        for (const auto& to : targets) {
            REQUIRE(index.importGraph.importedBy(to).count(from) == 1);
        }
    }
    for (const auto& [to, sources] : index.importGraph.reverse()) {
        for (const auto& from : sources) {
            REQUIRE(index.importGraph.importsOf(from).count(to) == 1);
        }
    }

    REQUIRE(index.importGraph.importedBy("app/models.py") ==
            std::set<std::string>{"app/main.py", "app/service.py"});
    REQUIRE(index.importGraph.importsOf("web/index.ts") == std::set<std::string>{"web/api.ts"});
    REQUIRE(index.importGraph.importsOf("web/api.ts") == std::set<std::string>{"shared/types.ts"});
    REQUIRE(index.importGraph.edgeCount() == 5);

    SECTION("Unresolved imports are kept for display") {
        REQUIRE(index.importsByFile.at("app/main.py").size() == 3);
        REQUIRE(index.importsByFile.at("web/index.ts").size() == 2);
    }
}

TEST_CASE("Building twice gives the same index", "[SymbolIndex]") {
    TempProject project("index_idempotent");
    project.write("pkg/__init__.py", "");
    project.write("pkg/a.py", "from .b import helper\n\nclass A:\n    def go(self):\n        helper()\n");
    project.write("pkg/b.py", "def helper():\n    return 1\n");
    project.write("lib/x.js", "const y = require('./y');\nfunction x() { return y(); }\n");
    project.write("lib/y.js", "module.exports = function y() { return 2; };\n");

    SymbolIndex first = buildFor(project);
    SymbolIndex second = buildFor(project);

    REQUIRE(first.files == second.files);
    REQUIRE(first.importGraph.forward() == second.importGraph.forward());
    REQUIRE(first.importGraph.reverse() == second.importGraph.reverse());
    REQUIRE(first.symbolsByName.size() == second.symbolsByName.size());
    for (const auto& [file, symbols] : first.symbolsByFile) {
        REQUIRE(symbolNames(symbols) == symbolNames(second.symbolsByFile.at(file)));
    }
}

TEST_CASE("Unparseable files are omitted", "[SymbolIndex]") {
    TempProject project("index_unparseable");
    project.write("good.py", "def ok():\n    pass\n");
    project.write("bad.py", "def broken(:\n    pass\n");
    project.write("notes.md", "# not code\n");

    SymbolIndex index = buildFor(project);

    REQUIRE(index.hasFile("good.py"));
    REQUIRE_FALSE(index.hasFile("bad.py"));
    REQUIRE_FALSE(index.hasFile("notes.md"));
    REQUIRE(index.skippedFiles == 1);
    REQUIRE(findSymbol(index, "broken").empty());
}

TEST_CASE("Duplicate names keep every definition in scan order", "[SymbolIndex]") {
    TempProject project("index_duplicates");
    project.write("alpha/run.py", "def run():\n    pass\n");
    project.write("beta/run.py", "def run():\n    pass\n");

    SymbolIndex index = buildFor(project);

    auto runs = findSymbol(index, "run");
    REQUIRE(runs.size() == 2);
    REQUIRE(runs[0].relativePath == "alpha/run.py");
    REQUIRE(runs[1].relativePath == "beta/run.py");

    const SymbolLocation* first = firstDefinition(index, "run");
    REQUIRE(first != nullptr);
    REQUIRE(first->relativePath == "alpha/run.py");
    REQUIRE(firstDefinition(index, "missing") == nullptr);
}

TEST_CASE("Imports resolving to the importing file add no edge", "[SymbolIndex]") {
    TempProject project("index_self");
    project.write("pkg/__init__.py", "from . import tools\n");

    SymbolIndex index = buildFor(project);

    REQUIRE(index.hasFile("pkg/__init__.py"));
    REQUIRE(index.importGraph.edgeCount() == 0);
    REQUIRE(index.importsByFile.at("pkg/__init__.py").size() == 1);
}

TEST_CASE("fileDependencies reports both directions", "[SymbolIndex]") {
    TempProject project("index_deps");
    project.write("a.py", "from .b import foo\n");
    project.write("b.py", "def foo():\n    pass\n\ndef bar():\n    pass\n");

    SymbolIndex index = buildFor(project);

    FileDependencies deps = fileDependencies(index, "b.py");
    REQUIRE(deps.error.empty());
    REQUIRE(deps.imports.empty());
    REQUIRE(deps.importedBy == std::vector<std::string>{"a.py"});
    REQUIRE(symbolNames(deps.symbols) == std::vector<std::string>{"foo", "bar"});

    FileDependencies missing = fileDependencies(index, "nope.py");
    REQUIRE(missing.error == "File not found in index: nope.py");
}

TEST_CASE("SymbolIndexBuilder rejects a missing root", "[SymbolIndex]") {
    PatternMatcher matcher;
    SymbolIndexBuilder builder("/non/existent/project", matcher);
    REQUIRE_THROWS_AS(builder.build(), std::runtime_error);
}
