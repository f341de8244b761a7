#include <boost/asio.hpp>
#include <boost/json.hpp>
#include <boost/log/trivial.hpp>
#include <boost/program_options.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "config.hpp"
#include "game_storage.hpp"

namespace asio = boost::asio;
namespace json = boost::json;

namespace {
constexpr std::string_view kInitialState = R"({"_stateID":0})";

turnstore::GameState parseState(const std::string &text) {
  auto value = json::parse(text);
  if (!value.is_object()) {
    throw std::invalid_argument("State must be a JSON object: " + text);
  }
  return std::move(value.as_object());
}

const std::string &argAt(const std::vector<std::string> &args, size_t index,
                         std::string_view what) {
  if (index >= args.size()) {
    throw std::invalid_argument("Missing argument: " + std::string(what));
  }
  return args[index];
}

/**
 * @brief Выполняет одну команду над хранилищем
 *
 * @return asio::awaitable<int> Код завершения
 */
asio::awaitable<int> runCommand(turnstore::GameStorage &storage,
                                std::string command,
                                std::vector<std::string> args) {
  co_await storage.connect();
  if (command == "new") {
    auto gameId = boost::uuids::to_string(boost::uuids::random_generator()());
    auto state = parseState(args.empty() ? std::string(kInitialState)
                                         : args.front());
    co_await storage.set(gameId, std::move(state));
    BOOST_LOG_TRIVIAL(info) << "[MAIN] Создана новая игра с id: " << gameId;
    std::cout << gameId << std::endl;
    co_return EXIT_SUCCESS;
  }
  if (command == "get") {
    auto state = co_await storage.get(argAt(args, 0, "game id"));
    if (!state) {
      BOOST_LOG_TRIVIAL(warning) << "[MAIN] Игра не найдена: " << args[0];
      co_return EXIT_FAILURE;
    }
    std::cout << json::serialize(*state) << std::endl;
    co_return EXIT_SUCCESS;
  }
  if (command == "set") {
    const auto &gameId = argAt(args, 0, "game id");
    co_await storage.set(gameId, parseState(argAt(args, 1, "state")));
    co_return EXIT_SUCCESS;
  }
  if (command == "has") {
    bool found = co_await storage.has(argAt(args, 0, "game id"));
    std::cout << std::boolalpha << found << std::endl;
    co_return EXIT_SUCCESS;
  }
  throw std::invalid_argument("Unknown command: " + command);
}
} // namespace

/**
 * @brief Точка входа консольной утилиты хранилища игр
 *
 * turnstore-cli [опции] <new|get|set|has> [аргументы]
 *
 * @return int Код завершения
 */
int main(int argc, char *argv[]) {
  namespace po = boost::program_options;
  try {
    turnstore::config::StorageConfig config;
    // Состояние в памяти исчезает вместе с процессом, утилите нужен диск
    config.backend = "file";
    auto storageDesc = turnstore::config::describeOptions(config);

    po::options_description desc("Allowed options");
    desc.add_options()("help,h", "Show help message");
    desc.add(storageDesc);

    po::options_description hidden;
    hidden.add_options()("command", po::value<std::string>(),
                         "Command: new, get, set, has")(
        "args", po::value<std::vector<std::string>>(), "Command arguments");
    po::options_description all;
    all.add(desc).add(hidden);

    po::positional_options_description positional;
    positional.add("command", 1).add("args", -1);

    // Командная строка сохраняется первой и имеет приоритет над окружением
    po::variables_map vm;
    po::store(po::command_line_parser(argc, argv)
                  .options(all)
                  .positional(positional)
                  .run(),
              vm);
    po::store(po::parse_environment(
                  storageDesc, turnstore::config::environmentMapper(storageDesc)),
              vm);
    po::notify(vm);

    if (vm.count("help") || !vm.count("command")) {
      std::cout << "Usage: turnstore-cli [options] <new|get|set|has> [args]\n"
                << desc << std::endl;
      return vm.count("help") ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    turnstore::config::setupLogging(config.logLevel);
    BOOST_LOG_TRIVIAL(debug) << "[MAIN] Параметры запуска: backend="
                             << config.backend
                             << ", cache-size=" << config.cacheSize;

    auto storage = turnstore::config::makeStorage(config);
    auto command = vm["command"].as<std::string>();
    auto args = vm.count("args") ? vm["args"].as<std::vector<std::string>>()
                                 : std::vector<std::string>{};

    asio::io_context ioc;
    int exitCode = EXIT_FAILURE;
    asio::co_spawn(ioc, runCommand(*storage, command, args),
                   [&exitCode](std::exception_ptr ep, int result) {
                     if (ep) {
                       std::rethrow_exception(ep);
                     }
                     exitCode = result;
                   });
    ioc.run();
    return exitCode;
  } catch (const std::exception &e) {
    BOOST_LOG_TRIVIAL(fatal) << "[MAIN] Ошибка: " << e.what() << std::endl;
    return EXIT_FAILURE;
  }
}
