#include <catch2/catch_test_macros.hpp>
#include "context_retrieval.hpp"
#include "test_support.hpp"

namespace {

SymbolIndex buildFor(const TempProject& project) {
    PatternMatcher matcher = makeRepositoryMatcher(project.root());
    SymbolIndexBuilder builder(project.root(), matcher);
    return builder.build();
}

const std::string LOGIN_SOURCE =
    "from .session import create_session\n"
    "\n"
    "def login(user, password):\n"
    "    token = create_session(user)\n"
    "    return token\n";

void writeAuthProject(TempProject& project) {
    project.write("auth/login.py", LOGIN_SOURCE);
    project.write("auth/session.py",
        "def create_session(user):\n"
        "    return user\n"
        "\n"
        "def session_expired(token):\n"
        "    return False\n");
    project.write("web/routes.py",
        "from ..auth.login import login\n"
        "\n"
        "def handle_login(request):\n"
        "    return login(request.user, request.password)\n");
    project.write("utils.py", "def unrelated():\n    pass\n");
}

} // namespace

TEST_CASE("extractKeywords drops stop words and short words", "[ContextRetrieval]") {
    REQUIRE(extractKeywords("How does the login session work?") ==
            std::vector<std::string>{"login", "session"});
    REQUIRE(extractKeywords("Where is the DB id of API users and users") ==
            std::vector<std::string>{"API", "users"});
    REQUIRE(extractKeywords("what is this?").empty());
}

TEST_CASE("smartContext ranks files by keyword relevance", "[ContextRetrieval]") {
    TempProject project("retrieval_smart");
    writeAuthProject(project);
    SymbolIndex index = buildFor(project);
    ContextRetriever retriever(index);

    SECTION("Scores combine symbol and usage matches") {
        SmartContext context = retriever.smartContext("How does the login session work?");

        REQUIRE(context.error.empty());
        REQUIRE(context.keywords == std::vector<std::string>{"login", "session"});
        REQUIRE(context.filesAnalyzed == 3);
        REQUIRE(context.files.size() == 3);

        REQUIRE(context.files[0].file == "auth/login.py");
        REQUIRE(context.files[0].score == 12);
        REQUIRE(context.files[0].matchedSymbols == std::vector<std::string>{"function login(user, password)"});
        REQUIRE(context.files[0].content == LOGIN_SOURCE);

        REQUIRE(context.files[1].file == "auth/session.py");
        REQUIRE(context.files[1].score == 10);
        REQUIRE(context.files[1].matchedSymbols ==
                std::vector<std::string>{"function create_session(user)", "function session_expired(token)"});

        REQUIRE(context.files[2].file == "web/routes.py");
        REQUIRE(context.files[2].score == 7);

        size_t chars = 0;
        for (const auto& file : context.files) {
            chars += file.content.size();
        }
        REQUIRE(context.estimatedTokens == chars / 4);
    }

    SECTION("The first files are cut to fit the budget") {
        SmartContext context = retriever.smartContext("login", 10);

        REQUIRE(context.files.size() == 1);
        REQUIRE(context.files[0].file == "auth/login.py");
        REQUIRE(context.files[0].content == LOGIN_SOURCE.substr(0, 40));
        REQUIRE(context.estimatedTokens == 10);
    }

    SECTION("Later files that don't fit are skipped") {
        RetrievalOptions options;
        options.truncateBelowFiles = 1;
        ContextRetriever strict(index, options);

        SmartContext context = strict.smartContext("login session", 40);
        REQUIRE(context.files.size() == 1);
        REQUIRE(context.files[0].content == LOGIN_SOURCE);
    }

    SECTION("Questions without keywords find nothing") {
        SmartContext context = retriever.smartContext("how does it work");
        REQUIRE(context.keywords.empty());
        REQUIRE(context.files.empty());
        REQUIRE(context.filesAnalyzed == 0);
    }
}

TEST_CASE("search orders exact symbol matches first", "[ContextRetrieval]") {
    TempProject project("retrieval_search");
    writeAuthProject(project);
    SymbolIndex index = buildFor(project);
    ContextRetriever retriever(index);

    SearchResults results = retriever.search("login session");

    REQUIRE(results.keywords == std::vector<std::string>{"login", "session"});
    REQUIRE(results.hits.size() == 7);

    REQUIRE(results.hits[0].exact);
    REQUIRE(results.hits[0].symbolMatch);
    REQUIRE(results.hits[0].file == "auth/login.py");
    REQUIRE(results.hits[0].symbol == "function login(user, password)");
    REQUIRE(results.hits[0].line == 3);

    REQUIRE(results.hits[1].symbol == "function handle_login(request)");
    REQUIRE_FALSE(results.hits[1].exact);
    REQUIRE(results.hits[2].file == "auth/session.py");
    REQUIRE(results.hits[2].symbol == "function create_session(user)");

    SECTION("Content matches follow the symbol matches") {
        for (size_t i = 3; i < results.hits.size(); ++i) {
            REQUIRE_FALSE(results.hits[i].symbolMatch);
        }
        REQUIRE(results.hits[3].file == "auth/login.py");
        REQUIRE(results.hits[3].line == 3);
        REQUIRE(results.hits[3].usageType == "definition");
        REQUIRE(results.hits[5].content == "return login(request.user, request.password)");
        REQUIRE(results.hits[6].line == 1);
        REQUIRE(results.hits[6].usageType == "import");
    }

    SECTION("topK bounds the results") {
        SearchResults top = retriever.search("login session", 2);
        REQUIRE(top.hits.size() == 2);
        REQUIRE(top.hits[0].exact);
    }
}

TEST_CASE("fileContext lists both sides of the import edges", "[ContextRetrieval]") {
    TempProject project("retrieval_file");
    writeAuthProject(project);
    SymbolIndex index = buildFor(project);
    ContextRetriever retriever(index);

    FileContext context = retriever.fileContext("auth/login.py");

    REQUIRE(context.error.empty());
    REQUIRE(context.content == LOGIN_SOURCE);
    REQUIRE(context.language == "python");
    REQUIRE(context.symbols == std::vector<std::string>{"function login(user, password)"});
    REQUIRE(context.imports == std::vector<std::string>{".session"});

    REQUIRE(context.related.size() == 2);
    REQUIRE(context.related[0].file == "auth/session.py");
    REQUIRE(context.related[0].relationship == "imports");
    REQUIRE(context.related[0].symbols.size() == 2);
    REQUIRE(context.related[1].file == "web/routes.py");
    REQUIRE(context.related[1].relationship == "used_by");
    REQUIRE(context.related[1].symbols.empty());

    SECTION("Missing files are reported") {
        REQUIRE(retriever.fileContext("missing.py").error == "File not found: missing.py");
        REQUIRE(retriever.fileContext("../outside.py").error == "File not found: ../outside.py");
    }

    SECTION("Files without a parser keep their content") {
        project.write("notes.txt", "plain text\n");
        FileContext notes = retriever.fileContext("notes.txt");
        REQUIRE(notes.error.empty());
        REQUIRE(notes.language == "unknown");
        REQUIRE(notes.content == "plain text\n");
        REQUIRE(notes.related.empty());
    }
}
