#include "config.hpp"

namespace codebox {
using namespace std;

double DEFAULT_TIME_LIMIT = 5;    // 5s
int DEFAULT_MEMORY_LIMIT = 256;   // 256M
double CPU_SHARE = 1.0;
double COMPILE_TIME_LIMIT = 10;   // 10s
size_t STREAM_SIZE = 1 << 20;     // 1M
int PROC_LIMIT = 64;

string PRIMARY_BACKEND = "api";
string DOCKER_ENDPOINT = "unix:///var/run/docker.sock";
string DOCKER_EXECUTABLE = "docker";
int PROVISION_TIME_LIMIT = 120;

string PYTHON_IMAGE = "python:3.11-slim";
string JAVASCRIPT_IMAGE = "node:20-slim";
string CPP_IMAGE = "gcc:13";
string CPP_COMPILE_FLAGS = "-std=c++17 -O2 -pipe";

size_t POOL_CAPACITY = 8;
int POOL_IDLE_TTL = 300;
int POOL_ACQUIRE_TIMEOUT = 30;

int PROBE_TIMEOUT = 2000;  // 2s
int PROBE_TTL = 60;
size_t FAILURE_THRESHOLD = 3;

size_t FAN_OUT = 1;
double SUBMISSION_MARGIN = 5;

filesystem::path RUN_DIR = "/tmp/codebox";
bool DEBUG = false;

}  // namespace codebox
