#include "sandbox/time_stats.hpp"
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>
#include <map>
#include <sstream>
#include "common/io_utils.hpp"

namespace scorer {
using namespace std;

static const string SIGNAL_PREFIX = "Command terminated by signal ";

static map<string, string> read_metadata(const string &text, optional<int> &signal) {
    map<string, string> mp;
    istringstream fin(text);
    string line;
    while (getline(fin, line)) {
        boost::algorithm::trim(line);
        if (line.compare(0, SIGNAL_PREFIX.length(), SIGNAL_PREFIX) == 0) {
            try {
                signal = boost::lexical_cast<int>(line.substr(SIGNAL_PREFIX.length()));
            } catch (boost::bad_lexical_cast &) {
                // ignore exception
            }
            continue;
        }

        size_t end = line.find(": ");
        if (end == string::npos) continue;
        string key = line.substr(0, end);
        string value = line.substr(end + 2);
        boost::algorithm::trim(value);
        mp[key] = value;
    }
    return mp;
}

template <typename T>
void try_to_parse(const string &text, optional<T> &value) {
    try {
        value = boost::lexical_cast<T>(text);
    } catch (boost::bad_lexical_cast &) {
        // ignore exception
    }
}

time_statistics parse_time_statistics(const string &text) {
    time_statistics result;
    auto metadata = read_metadata(text, result.terminating_signal);
    if (metadata.count("Maximum resident set size (kbytes)")) try_to_parse(metadata.at("Maximum resident set size (kbytes)"), result.max_resident_kb);
    if (metadata.count("User time (seconds)")) try_to_parse(metadata.at("User time (seconds)"), result.user_time);
    if (metadata.count("System time (seconds)")) try_to_parse(metadata.at("System time (seconds)"), result.sys_time);
    return result;
}

optional<time_statistics> read_time_statistics(const filesystem::path &stats_file) {
    auto content = read_regular_file(stats_file);
    if (!content) return {};
    return parse_time_statistics(*content);
}

}  // namespace scorer
