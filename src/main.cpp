#include <glog/logging.h>
#include <signal.h>
#include <sys/stat.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <nlohmann/json.hpp>
#include <thread>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "judge/judge_service.hpp"
#include "judge/toolchain.hpp"
#include "judge/workspace.hpp"
#include "server/memory_store.hpp"
#include "worker.hpp"
using namespace std;
namespace po = boost::program_options;

void sigintHandler(int /* signum */) {
    LOG(ERROR) << "Received SIGINT, stopping workers";
    codify::stop_workers();
}

/**
 * @brief 优先读取命令行参数，其次读取环境变量，都不存在时保持默认值
 */
template <typename T>
static void load_option(const po::variables_map &vm, const char *option, const char *env, T &target) {
    if (vm.count(option)) {
        target = vm.at(option).as<T>();
    } else if (env) {
        string value = codify::get_env(env, "");
        if (!value.empty()) target = boost::lexical_cast<T>(value);
    }
}

static string read_input(const po::variables_map &vm, const char *option) {
    if (!vm.count(option)) return "";
    string path = vm.at(option).as<string>();
    if (path == "-") return string(istreambuf_iterator<char>(cin), istreambuf_iterator<char>());
    return codify::read_file_content(path);
}

static int list_languages(const codify::toolchain_registry &registry) {
    auto missing = registry.probe();
    nlohmann::json languages = nlohmann::json::array();
    for (auto &id : registry.languages()) {
        const codify::toolchain &tc = registry.resolve(id);
        languages.push_back({{"id", id},
                             {"name", tc.display_name},
                             {"extension", tc.source_extension},
                             {"compiled", tc.has_compile_step()},
                             {"aliases", registry.aliases_of(id)},
                             {"available", !missing.count(id)}});
    }
    cout << languages.dump(2) << endl;
    return EXIT_SUCCESS;
}

static int run_code(codify::judge_service &service, const po::variables_map &vm) {
    string code = read_input(vm, "source");
    string input = read_input(vm, "stdin");
    string language = vm.count("language") ? vm.at("language").as<string>() : "";

    codify::run_result result = service.compile_and_run(code, language, input);
    nlohmann::json j = {{"success", result.success()},
                        {"language", result.language},
                        {"kind", codify::get_outcome_name(result.kind)},
                        {"errorType", codify::get_error_type_name(result.fault)},
                        {"output", result.output},
                        {"error", result.error},
                        {"executionTime", result.execution_time},
                        {"memoryUsed", result.memory_used}};
    cout << j.dump(2) << endl;
    return result.success() ? EXIT_SUCCESS : EXIT_FAILURE;
}

static int submit_code(codify::judge_service &service, const po::variables_map &vm) {
    codify::submit_request request;
    request.code = read_input(vm, "source");
    if (vm.count("language")) request.language = vm.at("language").as<string>();
    if (vm.count("user")) request.user_id = vm.at("user").as<string>();
    if (vm.count("problem")) request.problem_id = vm.at("problem").as<string>();
    if (vm.count("contest")) request.contest_id = vm.at("contest").as<string>();

    vector<thread> worker_threads;
    for (size_t i = 0; i < codify::JUDGE_WORKERS; ++i)
        worker_threads.push_back(codify::start_worker(i, service));

    codify::submission result;
    try {
        codify::submit_ack ack = service.submit(request);
        LOG(INFO) << "Submission " << ack.submission_id << ": " << ack.message;

        do {
            this_thread::sleep_for(chrono::milliseconds(50));
            result = service.get_submission(ack.submission_id);
        } while (!codify::is_terminal(result.status));
    } catch (std::exception &) {
        codify::stop_workers();
        for (auto &th : worker_threads) th.join();
        throw;
    }

    codify::stop_workers();
    for (auto &th : worker_threads) th.join();

    cout << nlohmann::json(result).dump(2) << endl;
    return result.status == codify::submission_status::ACCEPTED ? EXIT_SUCCESS : EXIT_FAILURE;
}

static int print_stats(codify::judge_service &service, codify::server::memory_store &store) {
    auto interactive = service.interactive_stats();
    auto judging = service.judging_stats();
    nlohmann::json j = {{"interactive", {{"max", interactive.max}, {"current", interactive.current}, {"queued", interactive.queued}}},
                        {"judging", {{"max", judging.max}, {"current", judging.current}, {"queued", judging.queued}}},
                        {"pendingJobs", service.jobs().size()},
                        {"store", store.dump()}};
    cout << j.dump(2) << endl;
    return EXIT_SUCCESS;
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    signal(SIGINT, sigintHandler);

    po::options_description desc("codify-judge options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("command", po::value<string>()->default_value("languages"), "command to execute: languages, run, submit, stats")
        ("source", po::value<string>(), "path of the source file, - for stdin")
        ("language", po::value<string>(), "language of the source file, e.g. cpp, python, java")
        ("stdin", po::value<string>(), "path of the file passed to the program as stdin when running")
        ("user", po::value<string>(), "id of the user submitting the code")
        ("problem", po::value<string>(), "id of the problem to judge against")
        ("contest", po::value<string>(), "id of the contest the submission belongs to")
        ("data", po::value<string>(), "JSON document with users, problems and contests to load. You can either pass it from environ CODIFY_DATA")
        ("temp-dir", po::value<string>(), "set the directory to store workspaces of user programs. You can either pass it from environ TEMPDIR_CODIFY")
        ("compile-concurrency", po::value<size_t>(), "set the maximum number of concurrent interactive runs, default to 20. You can either pass it from environ COMPILECONCURRENCY")
        ("judge-concurrency", po::value<size_t>(), "set the maximum number of concurrent judging submissions, default to 10. You can either pass it from environ JUDGECONCURRENCY")
        ("workers", po::value<size_t>(), "set the number of judging worker threads, default to judge concurrency. You can either pass it from environ JUDGEWORKERS")
        ("compile-time-limit", po::value<int>(), "set time limit in milliseconds for compiling submissions, default to 30000. You can either pass it from environ COMPILETIMELIMIT")
        ("run-time-limit", po::value<int>(), "set time limit in milliseconds for each test case, default to 10000. You can either pass it from environ RUNTIMELIMIT")
        ("interactive-time-limit", po::value<int>(), "set time limit in milliseconds for interactive runs, default to 30000. You can either pass it from environ INTERACTIVETIMELIMIT")
        ("compile-output-limit", po::value<size_t>(), "set output limit in bytes for compiling submissions, default to 5MB")
        ("run-output-limit", po::value<size_t>(), "set output limit in bytes for each test case, default to 2MB")
        ("interactive-output-limit", po::value<size_t>(), "set output limit in bytes for interactive runs, default to 10MB")
        ("max-code-length", po::value<size_t>(), "set the maximum length of submitted code, default to 50000")
        ("debug", "turn on the debug mode to log command lines of every spawned process.")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "Codify Judge: compile, run and judge code submissions" << endl
             << "Usage: " << argv[0] << " --command <languages|run|submit|stats> [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "codify-judge 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("debug") || getenv("DEBUG")) {
        codify::DEBUG = true;
    }

    string temp_dir = (filesystem::current_path() / "temp").string();
    load_option(vm, "temp-dir", "TEMPDIR_CODIFY", temp_dir);
    codify::TEMP_DIR = filesystem::path(temp_dir);
    filesystem::create_directories(codify::TEMP_DIR);
    CHECK(filesystem::is_directory(codify::TEMP_DIR))
        << "Temp directory " << codify::TEMP_DIR << " does not exist";

    load_option(vm, "compile-concurrency", "COMPILECONCURRENCY", codify::COMPILE_CONCURRENCY);
    load_option(vm, "judge-concurrency", "JUDGECONCURRENCY", codify::JUDGE_CONCURRENCY);
    codify::JUDGE_WORKERS = codify::JUDGE_CONCURRENCY;
    load_option(vm, "workers", "JUDGEWORKERS", codify::JUDGE_WORKERS);
    CHECK(codify::COMPILE_CONCURRENCY > 0) << "Compile concurrency should be positive";
    CHECK(codify::JUDGE_CONCURRENCY > 0) << "Judge concurrency should be positive";
    CHECK(codify::JUDGE_WORKERS > 0) << "Number of workers should be positive";

    load_option(vm, "compile-time-limit", "COMPILETIMELIMIT", codify::COMPILE_TIME_LIMIT);
    load_option(vm, "run-time-limit", "RUNTIMELIMIT", codify::RUN_TIME_LIMIT);
    load_option(vm, "interactive-time-limit", "INTERACTIVETIMELIMIT", codify::INTERACTIVE_TIME_LIMIT);
    load_option(vm, "compile-output-limit", nullptr, codify::COMPILE_OUTPUT_LIMIT);
    load_option(vm, "run-output-limit", nullptr, codify::RUN_OUTPUT_LIMIT);
    load_option(vm, "interactive-output-limit", nullptr, codify::INTERACTIVE_OUTPUT_LIMIT);
    load_option(vm, "max-code-length", nullptr, codify::MAX_CODE_LENGTH);

    // 让评测系统写入的数据只允许当前用户写入
    umask(0022);

    nlohmann::json seed = nlohmann::json::object();
    string data_path;
    load_option(vm, "data", "CODIFY_DATA", data_path);
    if (!data_path.empty()) {
        CHECK(filesystem::is_regular_file(data_path))
            << "Data file " << data_path << " does not exist";
        try {
            seed = nlohmann::json::parse(codify::read_file_content(data_path));
        } catch (std::exception &e) {
            LOG(FATAL) << "Data file " << data_path << " is malformed: " << e.what();
        }
    }

    codify::toolchain_registry registry;
    for (auto &[language, program] : registry.probe())
        LOG(WARNING) << "Toolchain for " << language << " is not available: " << program << " not found in PATH";

    codify::server::memory_store store(seed);
    codify::workspace_manager workspaces(codify::TEMP_DIR);
    codify::judge_service service(store, registry, workspaces,
                                  codify::COMPILE_CONCURRENCY, codify::JUDGE_CONCURRENCY,
                                  codify::execution_limits::interactive(), codify::execution_limits::judging());

    string command = vm.at("command").as<string>();
    try {
        if (command == "languages") {
            return list_languages(registry);
        } else if (command == "run") {
            return run_code(service, vm);
        } else if (command == "submit") {
            return submit_code(service, vm);
        } else if (command == "stats") {
            return print_stats(service, store);
        } else {
            cerr << "Unrecognized command " << command << endl
                 << desc << endl;
            return EXIT_FAILURE;
        }
    } catch (codify::validation_error &e) {
        cerr << "Invalid request: " << e.what() << endl;
        return EXIT_FAILURE;
    } catch (codify::not_found_error &e) {
        cerr << "Not found: " << e.what() << endl;
        return EXIT_FAILURE;
    } catch (codify::configuration_error &e) {
        cerr << "Configuration error: " << e.what() << endl;
        return EXIT_FAILURE;
    } catch (std::exception &e) {
        LOG(ERROR) << "Unexpected error: " << boost::diagnostic_information(e);
        return EXIT_FAILURE;
    }
}
