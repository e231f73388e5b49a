#include "unisrv/cli/commands.hpp"

#include <curl/curl.h>

int main(int argc, char **argv) {
  curl_global_init(CURL_GLOBAL_DEFAULT);
  const int code = unisrv::cli::run_cli(argc, argv);
  curl_global_cleanup();
  return code;
}
