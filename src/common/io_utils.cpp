#include "common/io_utils.hpp"
#include <glog/logging.h>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <fstream>
#include <mutex>
#include "common/exceptions.hpp"

namespace arbiter {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(const fs::path &path) {
    ifstream fin(path.string(), ios::binary);
    if (!fin) throw internal_error("unable to read file " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_prefix(const fs::path &path, size_t limit, bool &truncated) {
    ifstream fin(path.string(), ios::binary);
    if (!fin) throw internal_error("unable to read file " + path.string());
    string str(limit, '\0');
    fin.read(str.data(), limit);
    str.resize(fin.gcount());
    truncated = fin.peek() != char_traits<char>::eof();
    return str;
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path.string(), ios::binary | ios::trunc);
    if (!fout) throw internal_error("unable to write file " + path.string());
    fout << content;
    if (!fout) throw internal_error("unable to write file " + path.string());
}

string assert_safe_path(const string &subpath) {
    if (subpath.find("..") != string::npos || (!subpath.empty() && subpath[0] == '/'))
        throw runtime_error("subpath is not safe " + subpath);
    return subpath;
}

static string random_directory_name() {
    // random_generator 不是线程安全的
    static mutex generator_mutex;
    static boost::uuids::random_generator generator;
    lock_guard<mutex> guard(generator_mutex);
    return boost::uuids::to_string(generator());
}

scoped_directory::scoped_directory() {}

scoped_directory::scoped_directory(const fs::path &parent, bool keep)
    : dir(parent / random_directory_name()), keep(keep) {
    fs::create_directories(dir);
}

scoped_directory::scoped_directory(scoped_directory &&other) noexcept {
    *this = move(other);
}

scoped_directory::~scoped_directory() {
    release();
}

scoped_directory &scoped_directory::operator=(scoped_directory &&other) noexcept {
    swap(dir, other.dir);
    swap(keep, other.keep);
    return *this;
}

const fs::path &scoped_directory::path() const {
    return dir;
}

void scoped_directory::release() {
    if (dir.empty()) return;
    if (!keep) {
        error_code ec;
        fs::remove_all(dir, ec);
        if (ec) LOG(WARNING) << "Unable to remove directory " << dir << ": " << ec.message();
    }
    dir.clear();
}

}  // namespace arbiter
