#include "config.hpp"

namespace arbiter {
using namespace std;

filesystem::path RUN_DIR = "/tmp/arbiter";
filesystem::path CHROOT_DIR = "/chroot";
filesystem::path RUNGUARD = "/usr/local/bin/runguard";
string RUN_USER = "nobody";
string RUN_GROUP = "nogroup";
bool DEBUG = false;

}  // namespace arbiter
