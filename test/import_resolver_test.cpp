#include <catch2/catch_test_macros.hpp>
#include "import_resolver.hpp"
#include "test_support.hpp"

namespace {

Import relativeImport(const std::string& module) {
    Import imp;
    imp.module = module;
    imp.isRelative = true;
    return imp;
}

} // namespace

TEST_CASE("ImportResolver resolves dotted relative imports", "[ImportResolver]") {
    TempProject project("resolver_dotted");
    project.write("pkg/__init__.py", "");
    project.write("pkg/util.py", "def helper(): pass\n");
    project.write("pkg/sub/mod.py", "from ..util import helper\n");
    project.write("pkg/sub/deep/__init__.py", "");
    project.write("pkg/models/__init__.py", "");

    ImportResolver resolver(project.root());

    SECTION("Single dot stays in the importing file's directory") {
        auto target = resolver.resolve("pkg/main.py", relativeImport(".util"));
        REQUIRE(target.has_value());
        REQUIRE(*target == "pkg/util.py");
    }

    SECTION("Each extra dot ascends one directory") {
        auto target = resolver.resolve("pkg/sub/mod.py", relativeImport("..util"));
        REQUIRE(target.has_value());
        REQUIRE(*target == "pkg/util.py");
    }

    SECTION("Dotted segments descend into packages") {
        auto target = resolver.resolve("pkg/main.py", relativeImport(".sub.deep"));
        REQUIRE(target.has_value());
        REQUIRE(*target == "pkg/sub/deep/__init__.py");
    }

    SECTION("Bare dot resolves to the package entry") {
        auto target = resolver.resolve("pkg/models/user.py", relativeImport(".."));
        REQUIRE(target.has_value());
        REQUIRE(*target == "pkg/__init__.py");
    }

    SECTION("Missing targets yield a best-effort .py candidate") {
        auto target = resolver.resolve("pkg/main.py", relativeImport(".missing"));
        REQUIRE(target.has_value());
        REQUIRE(*target == "pkg/missing.py");
    }

    SECTION("Ascending past the root is unresolved") {
        REQUIRE_FALSE(resolver.resolve("top.py", relativeImport("...far")).has_value());
    }
}

TEST_CASE("ImportResolver resolves path imports", "[ImportResolver]") {
    TempProject project("resolver_path");
    project.write("src/app.ts", "import { a } from './lib/a';\n");
    project.write("src/lib/a.ts", "export const a = 1;\n");
    project.write("src/lib/b.tsx", "export const B = () => null;\n");
    project.write("src/components/index.ts", "export {};\n");
    project.write("src/util.js", "module.exports = {};\n");
    project.write("shared/config.mjs", "export default {};\n");

    ImportResolver resolver(project.root());

    SECTION("Extensions are tried in order") {
        REQUIRE(resolver.resolve("src/app.ts", relativeImport("./lib/a")).value() == "src/lib/a.ts");
        REQUIRE(resolver.resolve("src/app.ts", relativeImport("./lib/b")).value() == "src/lib/b.tsx");
        REQUIRE(resolver.resolve("src/app.ts", relativeImport("./util")).value() == "src/util.js");
    }

    SECTION("A path naming a file resolves to itself") {
        REQUIRE(resolver.resolve("src/app.ts", relativeImport("./util.js")).value() == "src/util.js");
    }

    SECTION("Parent paths are normalized") {
        REQUIRE(resolver.resolve("src/lib/a.ts", relativeImport("../../shared/config")).value() ==
                "shared/config.mjs");
    }

    SECTION("Directories resolve to their index file") {
        REQUIRE(resolver.resolve("src/app.ts", relativeImport("./components")).value() ==
                "src/components/index.ts");
    }

    SECTION("Missing targets keep the importing file's extension") {
        REQUIRE(resolver.resolve("src/app.ts", relativeImport("./nothing")).value() == "src/nothing.ts");
    }

    SECTION("Escaping the root is unresolved") {
        REQUIRE_FALSE(resolver.resolve("src/app.ts", relativeImport("../../outside")).has_value());
    }
}

TEST_CASE("ImportResolver ignores package imports", "[ImportResolver]") {
    TempProject project("resolver_package");
    project.write("os.py", "");

    ImportResolver resolver(project.root());

    Import absolute;
    absolute.module = "os";
    REQUIRE_FALSE(resolver.resolve("main.py", absolute).has_value());

    REQUIRE_FALSE(resolver.resolve("main.py", relativeImport("")).has_value());
}
