#include "utils.hpp"
#include <grp.h>
#include <pwd.h>
#include <algorithm>
#include <cctype>
#include <system_error>
#include "meta.hpp"

using namespace std;

meta_writer meta;

void meta_writer::open(const string &path) {
    if (path.empty()) return;
    file.open(path, ofstream::out | ofstream::trunc);
    if (!file) throw system_error(errno, generic_category(), "unable to open meta file " + path);
}

bool is_number(const string &s) {
    return !s.empty() && all_of(s.begin(), s.end(), [](unsigned char c) { return isdigit(c); });
}

int get_userid(const string &name) {
    errno = 0;
    struct passwd *pwd = getpwnam(name.c_str());
    if (!pwd) throw system_error(errno ? errno : ENOENT, generic_category(), "unable to find user " + name);
    return pwd->pw_uid;
}

int get_groupid(const string &name) {
    errno = 0;
    struct group *grp = getgrnam(name.c_str());
    if (!grp) throw system_error(errno ? errno : ENOENT, generic_category(), "unable to find group " + name);
    return grp->gr_gid;
}
