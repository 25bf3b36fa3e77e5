#include "terminfo.h"
#include <ncurses.h>
#include <term.h>
#include <cstdlib>

namespace leetshell {
namespace term {

TerminfoProbe probeTerminfo(int fd) {
    TerminfoProbe probe;
    const char* name = std::getenv("TERM");
    probe.termName = name ? name : "";
    if (probe.termName.empty() || probe.termName == "dumb") {
        probe.missing = "TERM is unset or dumb";
        return probe;
    }

    int err = 0;
    if (setupterm(probe.termName.c_str(), fd, &err) != OK) {
        probe.missing = "no terminfo entry";
        return probe;
    }

    static const char* required[] = {"cup", "smcup", "rmcup"};
    for (const char* cap : required) {
        char* s = tigetstr(cap);
        if (s == nullptr || s == reinterpret_cast<char*>(-1)) {
            if (!probe.missing.empty()) probe.missing += ", ";
            probe.missing += cap;
        }
    }
    del_curterm(cur_term);

    probe.ok = probe.missing.empty();
    return probe;
}

}
}
