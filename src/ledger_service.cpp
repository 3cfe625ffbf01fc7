#include <cstddef>
#include <exception>
#include <format>

#include "httplib.h"

#include "clients.hpp"
#include "config.hpp"
#include "database.hpp"
#include "gateway.hpp"
#include "logging.hpp"
#include "statement.hpp"
#include "transactions.hpp"

#define PROJECT_NAME "ledger-service"

int
main(int, char **) {
    try {
      const auto config = config::fromEnvironment();
      const auto options = config.database();

      database::provision(options, config.initSql, config.resetDatabase);

      auto table = clients::load(options);

      if (!table.has_value()) {
        logging::error(std::format("couldn't load clients: {}", to_string(table.error())));
        return 1;
      }

      const transactions::Processor processor{options, **table};
      const statement::Builder builder{options, **table};

      // HTTP
      httplib::Server svr;

      const auto threads = static_cast<std::size_t>(config.threads);
      svr.new_task_queue = [threads] { return new httplib::ThreadPool(threads); };

      gateway::registerRoutes(svr, processor, builder, config.accessLog);

      logging::info(std::format("{} listening on {}:{} with {} threads, {} clients",
                                PROJECT_NAME, config.host, config.port, config.threads, (*table)->size()));

      if (!svr.listen(config.host, config.port)) {
        logging::error(std::format("couldn't listen on {}:{}", config.host, config.port));
        return 1;
      }
    } catch (const std::exception &e) {
      logging::error(std::format("{} failed to start: {}", PROJECT_NAME, e.what()));
      return 1;
    }

    return 0;
}
