// gemtab-replay: headless session driver
//
// Replays a YAML script of input events against a gemtab Session backed by
// in-memory widgets, then prints the state of every tab. Navigation is served
// from the document table of the script and completes on the next loop
// iteration, like a real fetch would.
//
// Script format:
//   documents:
//     - url: gemini://example.org/
//       mediatype: text/gemini
//       raw: "# Example\n=> /a A\n"
//       links: [/a]
//   steps:
//     - open: gemini://example.org/
//     - key: enter
//     - key: tab
//     - back
//     - resize: [100, 30]

#include <gemtab/config.h>
#include <gemtab/document.h>
#include <gemtab/memory-widgets.h>
#include <gemtab/navigator.h>
#include <gemtab/session.h>

#include <args.hxx>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>
#include <ytrace/ytrace.hpp>

#include <algorithm>
#include <chrono>
#include <deque>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

#include <unistd.h>

using namespace gemtab;

namespace {

//=============================================================================
// Document table and cache
//=============================================================================

struct DocumentSpec {
    std::string url;
    std::string rawMediatype = "text/gemini";
    std::string raw;
    std::vector<std::string> links;
};

using DocumentTable = std::unordered_map<std::string, DocumentSpec>;

// Relative link resolution is the fetcher's job; this covers what scripts use
static std::string resolveUrl(const std::string& base, const std::string& target) {
    if (target.empty()) return base;
    if (target.find("://") != std::string::npos || base.empty()) {
        return target;
    }
    const auto schemeEnd = base.find("://");
    const size_t hostStart = schemeEnd == std::string::npos ? 0 : schemeEnd + 3;
    const auto pathStart = base.find('/', hostStart);
    if (target.front() == '/') {
        return base.substr(0, pathStart) + target;
    }
    if (pathStart == std::string::npos) {
        return base + "/" + target;
    }
    return base.substr(0, base.rfind('/') + 1) + target;
}

//=============================================================================
// Renderer - left margin and longest line, enough to exercise reflow
//=============================================================================

class MarginRenderer : public Renderer {
public:
    Result<Rendered> render(const Document& document, int width) override {
        if (width <= 0) {
            return Err<Rendered>("invalid width " + std::to_string(width));
        }
        const std::string margin(static_cast<size_t>(std::min(width / 10, 8)), ' ');

        Rendered out;
        std::istringstream in(document.raw);
        std::string line;
        int longest = 0;
        while (std::getline(in, line)) {
            longest = std::max(longest, static_cast<int>(line.size()));
            out.content += margin + line + "\n";
        }
        out.maxPreCols = document.mediatype == Mediatype::Plain
                             ? Document::UNLIMITED_PRE_COLS
                             : longest + static_cast<int>(margin.size());
        ydebug("gemtab-replay: rendered {} for width {}", document.url, width);
        return Ok(out);
    }
};

//=============================================================================
// Navigator - serves the document table, completes on the next iteration
//=============================================================================

class ScriptNavigator : public Navigator {
public:
    ScriptNavigator(DocumentTable table,
                    std::chrono::seconds maxAge)
        : _table(std::move(table)), _maxAge(maxAge) {}

    void followLink(TabId tabId, const std::string& baseUrl,
                    const std::string& relativeUrl) override {
        _pending.push_back({tabId, resolveUrl(baseUrl, relativeUrl), NavigationKind::New});
    }

    void load(TabId tabId, const std::string& url) override {
        _pending.push_back({tabId, url, NavigationKind::History});
    }

    void processPending(Session& session) {
        while (!_pending.empty()) {
            auto request = _pending.front();
            _pending.pop_front();

            auto doc = fetch(request.url);
            Result<void> res = doc
                ? session.navigationCompleted(request.tabId, doc, request.kind)
                : session.navigationFailed(request.tabId, request.kind,
                                           "Not found: " + request.url);
            if (!res) {
                ywarn("gemtab-replay: {}", error_msg(res));
            }
        }
    }

    size_t cachedBytes() const {
        size_t n = 0;
        for (const auto& [url, doc] : _cache) n += doc->approximateSize();
        return n;
    }

private:
    struct Request {
        TabId tabId;
        std::string url;
        NavigationKind kind;
    };

    // Cached documents are shared with the tabs, so saved scroll positions
    // come back on revisit
    Document::Ptr fetch(const std::string& url) {
        auto cached = _cache.find(url);
        if (cached != _cache.end() &&
            !cached->second->isStale(Document::Clock::now(), _maxAge)) {
            ydebug("gemtab-replay: cache hit {}", url);
            return cached->second;
        }

        auto it = _table.find(url);
        if (it == _table.end()) {
            return nullptr;
        }
        auto doc = Document::create(url);
        doc->rawMediatype = it->second.rawMediatype;
        doc->mediatype = mediatypeFromString(doc->rawMediatype);
        doc->raw = it->second.raw;
        doc->links = it->second.links;
        doc->createdAt = Document::Clock::now();
        _cache[url] = doc;
        return doc;
    }

    DocumentTable _table;
    std::unordered_map<std::string, Document::Ptr> _cache;
    std::deque<Request> _pending;
    std::chrono::seconds _maxAge;
};

//=============================================================================
// Script
//=============================================================================

static Result<DocumentTable> loadDocuments(const YAML::Node& script) {
    DocumentTable table;
    const YAML::Node docs = script["documents"];
    if (!docs) return Ok(table);
    if (!docs.IsSequence()) {
        return Err<DocumentTable>("'documents' must be a list");
    }
    for (const auto& node : docs) {
        DocumentSpec spec;
        spec.url = node["url"].as<std::string>("");
        if (spec.url.empty()) {
            return Err<DocumentTable>("document without url");
        }
        spec.rawMediatype = node["mediatype"].as<std::string>("text/gemini");
        spec.raw = node["raw"].as<std::string>("");
        if (const YAML::Node links = node["links"]; links && links.IsSequence()) {
            for (const auto& link : links) {
                spec.links.push_back(link.as<std::string>());
            }
        }
        table[spec.url] = spec;
    }
    return Ok(table);
}

static Result<Key> parseKey(const std::string& name) {
    if (name == "enter") return Ok(Key::Enter);
    if (name == "escape" || name == "esc") return Ok(Key::Escape);
    if (name == "tab") return Ok(Key::Tab);
    if (name == "backtab" || name == "shift-tab") return Ok(Key::Backtab);
    if (name == "other") return Ok(Key::Other);
    return Err<Key>("unknown key '" + name + "'");
}

static Result<void> runStep(const YAML::Node& step, Session& session, Navigator& navigator) {
    // Bare scalars: "back", "forward", "new-tab", "page-up", "page-down"
    if (step.IsScalar()) {
        const std::string cmd = step.as<std::string>();
        if (cmd == "back") return session.goBack(session.activeIndex());
        if (cmd == "forward") return session.goForward(session.activeIndex());
        if (cmd == "new-tab") {
            session.newTab();
            return Ok();
        }
        if (cmd == "page-up") {
            session.pageUp();
            return Ok();
        }
        if (cmd == "page-down") {
            session.pageDown();
            return Ok();
        }
        return Err("unknown step '" + cmd + "'");
    }

    if (!step.IsMap() || step.size() != 1) {
        return Err("a step is a command or a single-key mapping");
    }
    const std::string cmd = step.begin()->first.as<std::string>();
    const YAML::Node arg = step.begin()->second;

    if (cmd == "key") {
        auto key = parseKey(arg.as<std::string>());
        if (!key) return Err("bad key step", key);
        session.handleKey(*key);
        return Ok();
    }
    if (cmd == "open") {
        const std::string base = session.activeTab().hasContent()
            ? session.activeTab().document()->url : std::string();
        navigator.followLink(session.activeTab().id(), base, arg.as<std::string>());
        return Ok();
    }
    if (cmd == "switch-tab") return session.switchTab(arg.as<size_t>());
    if (cmd == "close-tab") return session.closeTab(arg.as<size_t>());
    if (cmd == "scroll") {
        if (!arg.IsSequence() || arg.size() != 2) return Err("scroll takes [row, column]");
        session.activeTab().viewport().scrollTo(arg[0].as<int>(), arg[1].as<int>());
        return Ok();
    }
    if (cmd == "resize") {
        if (!arg.IsSequence() || arg.size() != 2) return Err("resize takes [width, height]");
        auto res = session.resize(arg[0].as<int>(), arg[1].as<int>());
        if (!res) return Err("resize failed", res);
        return Ok();
    }
    return Err("unknown step '" + cmd + "'");
}

static void printState(Session& session) {
    for (size_t i = 0; i < session.tabCount(); i++) {
        auto tab = session.tab(i);
        const auto& doc = tab->document();
        auto [row, column] = tab->viewport().scrollOffset();
        std::cout << (i == session.activeIndex() ? "* " : "  ") << "tab " << i << ": "
                  << doc->url << " [" << mediatypeName(doc->mediatype) << "]"
                  << " scroll=" << row << "," << column
                  << " mode=" << (tab->mode() == NavigationMode::LinkSelect ? "link-select" : "normal")
                  << "\n";
        std::cout << "    history:";
        const auto& urls = tab->history().urls();
        for (size_t h = 0; h < urls.size(); h++) {
            std::cout << (static_cast<int>(h) == tab->history().position() ? " >" : " ") << urls[h];
        }
        std::cout << "\n";
    }
    std::cout << "status: [" << session.statusBar().label() << "] "
              << session.statusBar().text() << "\n";
}

} // anonymous namespace

//=============================================================================
// Main
//=============================================================================

int main(int argc, char* argv[]) {
    args::ArgumentParser parser("gemtab-replay", "Replay a tab session script headlessly");
    args::HelpFlag help(parser, "help", "Show help", {'h', "help"});
    args::ValueFlag<std::string> configFlag(parser, "config", "Config file (default $XDG_CONFIG_HOME/gemtab/config.yaml)", {'c', "config"});
    args::ValueFlag<std::string> logFlag(parser, "log", "Log file (default /tmp/gemtab-replay-<pid>.log)", {'l', "log-file"});
    args::ValueFlag<int> widthFlag(parser, "width", "Terminal width (default 80)", {'W', "width"}, 80);
    args::ValueFlag<int> heightFlag(parser, "height", "Terminal height (default 24)", {'H', "height"}, 24);
    args::Positional<std::string> scriptArg(parser, "script", "YAML session script");

    try {
        parser.ParseCLI(argc, argv);
    } catch (const args::Help&) {
        std::cout << parser;
        return 0;
    } catch (const args::Error& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    }

    if (!scriptArg) {
        std::cerr << "gemtab-replay: missing script" << std::endl;
        return 1;
    }

    auto configResult = Config::create(args::get(configFlag));
    if (!configResult) {
        std::cerr << "gemtab-replay: " << error_msg(configResult) << std::endl;
        return 1;
    }
    auto config = *configResult;

    std::string logPath = logFlag ? args::get(logFlag) : config->logFile();
    if (logPath.empty()) {
        logPath = "/tmp/gemtab-replay-" + std::to_string(getpid()) + ".log";
    }
    try {
        auto fileLogger = spdlog::basic_logger_mt("gemtab-replay", logPath, true);
        spdlog::set_default_logger(fileLogger);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "gemtab-replay: cannot log to " << logPath << ": " << e.what() << std::endl;
        return 1;
    }
    spdlog::set_level(spdlog::level::from_str(config->logLevel()));
    spdlog::flush_on(spdlog::level::warn);

    yinfo("gemtab-replay: starting, pid={}, log={}", getpid(), logPath);

    YAML::Node script;
    try {
        script = YAML::LoadFile(args::get(scriptArg));
    } catch (const YAML::Exception& e) {
        std::cerr << "gemtab-replay: " << args::get(scriptArg) << ": " << e.what() << std::endl;
        return 1;
    }

    auto table = loadDocuments(script);
    if (!table) {
        std::cerr << "gemtab-replay: " << error_msg(table) << std::endl;
        return 1;
    }

    MemoryStatusBar bar;
    MarginRenderer renderer;
    ScriptNavigator navigator(std::move(*table), config->cacheMaxAge());

    SessionOptions options = SessionOptions::fromConfig(*config);
    options.termWidth = args::get(widthFlag);
    options.termHeight = args::get(heightFlag);

    Session session(bar, navigator, renderer,
                    [] { return std::make_shared<MemoryViewport>(); }, options);

    int failures = 0;
    const YAML::Node steps = script["steps"];
    if (steps && steps.IsSequence()) {
        size_t n = 0;
        for (const auto& step : steps) {
            Result<void> res = Ok();
            try {
                res = runStep(step, session, navigator);
            } catch (const YAML::Exception& e) {
                res = Err(std::string("malformed step: ") + e.what());
            }
            if (!res) {
                std::cout << "step " << n << ": " << error_msg(res) << "\n";
                failures++;
            }
            navigator.processPending(session);
            n++;
        }
    }

    printState(session);
    yinfo("gemtab-replay: done, {} failed steps, {} bytes cached", failures, navigator.cachedBytes());
    return failures == 0 ? 0 : 2;
}
