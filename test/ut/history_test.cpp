//=============================================================================
// History Tests
//=============================================================================

#include <cstddef>
#include <string>

#include <boost/ut.hpp>
#include <gemtab/history.h>

using namespace boost::ut;
using namespace gemtab;

suite history_tests = [] {
    "empty history"_test = [] {
        History history;
        expect(history.empty());
        expect(history.position() == -1_i);
        expect(history.current().empty());
        expect(!history.canGoBack());
        expect(!history.canGoForward());
    };

    "push moves the cursor to the end"_test = [] {
        History history;
        history.push("a");
        history.push("b");
        history.push("c");

        expect(history.size() == 3_ul);
        expect(history.position() == 2_i);
        expect(history.current() == "c");
        expect(history.canGoBack());
        expect(!history.canGoForward());
    };

    "back and forward walk the entries"_test = [] {
        History history;
        history.push("a");
        history.push("b");
        history.push("c");

        auto back = history.back();
        expect(back.has_value() >> fatal);
        expect(*back == "b");
        expect(history.position() == 1_i);

        auto forward = history.forward();
        expect(forward.has_value() >> fatal);
        expect(*forward == "c");
        expect(history.position() == 2_i);
    };

    "push after back drops the forward branch"_test = [] {
        History history;
        history.push("a");
        history.push("b");
        history.push("c");
        expect(history.back().has_value());
        expect(history.back().has_value());
        history.push("d");

        expect(history.size() == 2_ul);
        expect(history.urls()[0] == "a");
        expect(history.urls()[1] == "d");
        expect(history.position() == 1_i);
        expect(!history.canGoForward());
    };

    "back at the first entry fails and keeps the cursor"_test = [] {
        History history;
        history.push("a");

        auto res = history.back();
        expect(!res.has_value() >> fatal);
        expect(res.error().message() == "no history available");
        expect(history.position() == 0_i);
        expect(history.current() == "a");
    };

    "forward at the last entry fails and keeps the cursor"_test = [] {
        History history;
        history.push("a");
        history.push("b");

        auto res = history.forward();
        expect(!res.has_value() >> fatal);
        expect(res.error().message() == "no history available");
        expect(history.position() == 1_i);
    };

    "back on empty history fails"_test = [] {
        History history;
        expect(!history.back().has_value());
        expect(!history.forward().has_value());
        expect(history.position() == -1_i);
    };

    "cursor stays in range through a long walk"_test = [] {
        History history;
        for (int i = 0; i < 5; ++i) {
            history.push("u" + std::to_string(i));
        }
        for (int i = 0; i < 8; ++i) {
            (void)history.back();
        }
        expect(history.position() == 0_i);
        for (int i = 0; i < 8; ++i) {
            (void)history.forward();
        }
        expect(history.position() == 4_i);
        expect(history.position() < static_cast<int>(history.size()));
    };
};
