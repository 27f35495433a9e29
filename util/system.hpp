#ifndef SYSTEM_HPP
#define SYSTEM_HPP

#include <cstdlib>
#include <ctime>
#include <string>

static inline std::string now() {
    using namespace std;
    time_t rawtime;
    struct tm * timeinfo;
    char buf[80];
    time(&rawtime);
    timeinfo = localtime(&rawtime);
    strftime(buf, 80, "%Y-%m-%d-%H-%M-%S", timeinfo);
    return buf;
}

// creates a folder including its parents, true on success
static inline bool make_folder(const std::string & path) {
    std::string command = "mkdir -p '" + path + "'";
    return std::system(command.c_str()) == 0;
}

// folder for results of this run, in $HOME (or the working directory if HOME is not set)
static inline const std::string & save_folder(bool timestamp = true, const std::string & prefix = "gmid_results") {
    static std::string folder;

    if (folder.empty()) {
        const char * home = std::getenv("HOME");
        folder = std::string(home ? home : ".") + "/" + prefix + (timestamp ? "_" + now() : "");
    }

    return folder;
}

#endif
