#include "admin/admin_client.hpp"
#include "config/config.hpp"
#include "http/http_server.hpp"
#include <iostream>
#include <memory>

using namespace yggdash;

int main(int argc, char **argv) {
  Config cfg;
  try {
    cfg = parse_args(argc, argv);
  } catch (const std::invalid_argument &e) {
    std::cerr << "Error: " << e.what() << "\n" << usage(argv[0]);
    return 1;
  }
  if (cfg.show_help) {
    std::cout << usage(argv[0]);
    return 0;
  }

  std::cout << "Using node name: " << cfg.node_name << std::endl;
  std::cout << "Using admin socket address: " << to_string(cfg.admin)
            << std::endl;
  std::cout << "Listening on address: " << cfg.listen_address << std::endl;

  try {
    auto handler = std::make_shared<const http_server::request_handler>(
        cfg.node_name, AdminClient(cfg.admin, cfg.admin_timeout),
        cfg.asset_dir);
    http_server::http_server server(handler, cfg.listen_host,
                                    cfg.listen_port, cfg.threads);
    server.run();
  } catch (const std::exception &e) {
    std::cerr << "Fatal Error: " << e.what() << "\n";
    return 1;
  }
  std::cout << "Shutting down" << std::endl;
  return 0;
}
