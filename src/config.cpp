#include "config.hpp"

namespace codify {
using namespace std;

filesystem::path TEMP_DIR;
size_t COMPILE_CONCURRENCY = 20;
size_t JUDGE_CONCURRENCY = 10;
size_t JUDGE_WORKERS = 10;

int COMPILE_TIME_LIMIT = 30000;      // 30s
int RUN_TIME_LIMIT = 10000;          // 10s
int INTERACTIVE_TIME_LIMIT = 30000;  // 30s

size_t COMPILE_OUTPUT_LIMIT = 5 << 20;       // 5M
size_t RUN_OUTPUT_LIMIT = 2 << 20;           // 2M
size_t INTERACTIVE_OUTPUT_LIMIT = 10 << 20;  // 10M

size_t MAX_CODE_LENGTH = 50000;
int STANDALONE_MAX_SCORE = 100;
bool DEBUG = false;

}  // namespace codify
