#include "http_server.hpp"
#include "ankiplace/canvas.hpp"
#include "ankiplace/config.hpp"
#include "ankiplace/durable_store.hpp"
#include "ankiplace/gateway.hpp"
#include "ankiplace/instance_lock.hpp"
#include "ankiplace/logging.hpp"
#include "ankiplace/read_pool.hpp"
#include "ankiplace/write_serializer.hpp"

#include <exception>
#include <string>


/*
 * Entry point for the server executable.
 * read config from the environment
 * open the store, start the writer and the readers
 * serve until SIGINT/SIGTERM, then shut down in reverse order
 */

int main() {
    using namespace ankiplace;
    try {
        Config config = Config::from_env();
        if (config.uses_default_secret())
            log_warn("Main", "ANKIPLACE_SECRET is not set, using the default secret");

        InstanceLock lock{config.db_path};
        DurableStore store{config.db_path, canvas::create_schema};
        log_info("Main", "Store ready at " + store.path());

        ReadPool readers{store, config.reader_options()};
        WriteSerializer writer{store.writer(), config.writer_options()};
        Gateway gateway{readers, writer, config.secret, config.request_timeout};

        HttpServer server{gateway, config.worker_threads};
        server.install_signal_handlers();
        server.start(config.port);

        // server, gateway, writer (drains), readers, store, lock
        log_info("Main", "Shutting down");
    } catch (const std::exception& e) {
        log_error("Main", e.what());
        return 1;
    }
    return 0;
}
