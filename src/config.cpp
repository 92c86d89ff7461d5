#include "config.hpp"

namespace codebox {
using namespace std;

filesystem::path RUN_DIR = filesystem::temp_directory_path() / "codebox";
bool DEBUG = false;

}  // namespace codebox
