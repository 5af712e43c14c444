#include <glog/logging.h>
#include <sys/stat.h>
#include <unistd.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "env.hpp"
#include "judge/report.hpp"
#include "judge/scorer.hpp"
#include "judge/session.hpp"
#include "sandbox/language.hpp"
#include "sandbox/launcher.hpp"
using namespace std;

static void print_report(const nlohmann::json& report) {
    // 选手程序的输出可能不是合法的 UTF-8
    cout << report.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << endl;
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("sandbox-scorer options");
    po::positional_options_description positional;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("request", po::value<string>(), "path to the scoring request json, or - to read it from stdin")
        ("docker", po::value<string>(), "set the container runtime executable, default to docker. You can either pass it from environ DOCKER")
        ("image", po::value<string>(), "set the container image with python and GNU time installed, default to python-with-time. You can either pass it from environ DOCKERIMAGE")
        ("time-binary", po::value<string>(), "set the path of GNU time inside the image, default to /usr/bin/time. You can either pass it from environ TIMEBINARY")
        ("interpreter", po::value<string>(), "set the interpreter command inside the image, default to python. You can either pass it from environ INTERPRETER")
        ("cpus", po::value<string>(), "set the cpu share of each container, default to 0.5. You can either pass it from environ CPULIMIT")
        ("time-limit", po::value<double>(), "set the default time limit in seconds of test cases without one, default to 10. You can either pass it from environ TIMELIMIT")
        ("memory-limit", po::value<int>(), "set the default memory limit in MB of test cases without one, default to 128. You can either pass it from environ MEMLIMIT")
        ("run-dir", po::value<string>(), "set the directory to create workspaces in, default to the system temporary directory. You can either pass it from environ RUNDIR")
        ("mount-point", po::value<string>(), "set where the workspace is mounted inside the container, default to /sandbox. You can either pass it from environ MOUNTPOINT")
        ("run-user", po::value<string>(), "set uid:gid the program runs as inside the container, default to the current user. You can either pass it from environ RUNUSER")
        ("parallel", po::value<size_t>(), "set the maximum number of test cases running at the same time, 0 for unlimited. You can either pass it from environ PARALLEL")
        ("skip-runtime-check", "do not check whether the container runtime is available before scoring. You can either pass it from environ SKIPRUNTIMECHECK")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on
    positional.add("request", 1);

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(positional)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return scorer::E_USAGE_ERROR;
    }

    if (vm.count("help")) {
        cout << "sandbox-scorer: Run python code against test cases in docker containers, score them" << endl
             << "Usage: " << argv[0] << " [options] <request.json|->" << endl;
        cout << desc << endl;
        return scorer::E_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "sandbox-scorer 1.0" << endl;
        return scorer::E_SUCCESS;
    }

    if (!vm.count("request")) {
        cerr << "Scoring request is required" << endl
             << endl;
        cerr << desc << endl;
        return scorer::E_USAGE_ERROR;
    }

    try {
        if (vm.count("docker")) {
            scorer::DOCKER_BINARY = vm.at("docker").as<string>();
        } else if (getenv("DOCKER")) {
            scorer::DOCKER_BINARY = getenv("DOCKER");
        }

        if (vm.count("image")) {
            scorer::DOCKER_IMAGE = vm.at("image").as<string>();
        } else if (getenv("DOCKERIMAGE")) {
            scorer::DOCKER_IMAGE = getenv("DOCKERIMAGE");
        }

        if (vm.count("time-binary")) {
            scorer::TIME_BINARY = vm.at("time-binary").as<string>();
        } else if (getenv("TIMEBINARY")) {
            scorer::TIME_BINARY = getenv("TIMEBINARY");
        }

        if (vm.count("interpreter")) {
            scorer::INTERPRETER = vm.at("interpreter").as<string>();
        } else if (getenv("INTERPRETER")) {
            scorer::INTERPRETER = getenv("INTERPRETER");
        }

        if (vm.count("cpus")) {
            scorer::CPU_LIMIT = vm.at("cpus").as<string>();
        } else if (getenv("CPULIMIT")) {
            scorer::CPU_LIMIT = getenv("CPULIMIT");
        }
        boost::lexical_cast<double>(scorer::CPU_LIMIT);  // 确保 CPU 份额是一个数字

        if (vm.count("time-limit")) {
            scorer::DEFAULT_TIME_LIMIT = vm.at("time-limit").as<double>();
        } else if (getenv("TIMELIMIT")) {
            scorer::DEFAULT_TIME_LIMIT = boost::lexical_cast<double>(getenv("TIMELIMIT"));
        }
        CHECK(scorer::DEFAULT_TIME_LIMIT > 0)
            << "Default time limit should be positive";

        if (vm.count("memory-limit")) {
            scorer::DEFAULT_MEMORY_LIMIT = vm.at("memory-limit").as<int>();
        } else if (getenv("MEMLIMIT")) {
            scorer::DEFAULT_MEMORY_LIMIT = boost::lexical_cast<int>(getenv("MEMLIMIT"));
        }
        CHECK(scorer::DEFAULT_MEMORY_LIMIT > 0)
            << "Default memory limit should be positive";

        if (vm.count("run-dir")) {
            scorer::RUN_DIR = filesystem::path(vm.at("run-dir").as<string>());
        } else if (getenv("RUNDIR")) {
            scorer::RUN_DIR = filesystem::path(getenv("RUNDIR"));
        } else {
            scorer::RUN_DIR = filesystem::temp_directory_path();
        }
        CHECK(filesystem::is_directory(scorer::RUN_DIR))
            << "Run directory " << scorer::RUN_DIR << " does not exist";

        if (vm.count("mount-point")) {
            scorer::MOUNT_POINT = vm.at("mount-point").as<string>();
        } else if (getenv("MOUNTPOINT")) {
            scorer::MOUNT_POINT = getenv("MOUNTPOINT");
        }
        CHECK(!scorer::MOUNT_POINT.empty() && scorer::MOUNT_POINT[0] == '/')
            << "Mount point " << scorer::MOUNT_POINT << " should be an absolute path";

        if (vm.count("run-user")) {
            scorer::RUN_USER = vm.at("run-user").as<string>();
        } else if (getenv("RUNUSER")) {
            scorer::RUN_USER = getenv("RUNUSER");
        }

        if (vm.count("parallel")) {
            scorer::MAX_PARALLEL = vm.at("parallel").as<size_t>();
        } else if (getenv("PARALLEL")) {
            scorer::MAX_PARALLEL = boost::lexical_cast<size_t>(getenv("PARALLEL"));
        }
    } catch (boost::bad_lexical_cast& e) {
        cerr << "Invalid configuration: " << e.what() << endl;
        return scorer::E_USAGE_ERROR;
    } catch (filesystem::filesystem_error& e) {
        cerr << "Invalid configuration: " << e.what() << endl;
        return scorer::E_USAGE_ERROR;
    }

    // 让评测系统写入的数据只允许当前用户写入
    umask(0022);

    scorer::scoring_request request;
    try {
        nlohmann::json j;
        string request_path = vm.at("request").as<string>();
        if (request_path == "-") {
            cin >> j;
        } else {
            ifstream fin(request_path);
            if (!fin) {
                cerr << "Unable to open scoring request " << request_path << endl;
                return scorer::E_USAGE_ERROR;
            }
            fin >> j;
        }
        request = scorer::parse_scoring_request(j);
    } catch (nlohmann::json::exception& e) {
        cerr << "Malformed scoring request: " << e.what() << endl;
        return scorer::E_USAGE_ERROR;
    } catch (invalid_argument& e) {
        cerr << "Malformed scoring request: " << e.what() << endl;
        return scorer::E_USAGE_ERROR;
    }

    if (!vm.count("skip-runtime-check") && !getenv("SKIPRUNTIMECHECK")) {
        string message;
        if (!scorer::container_runtime_available(message)) {
            LOG(ERROR) << "Container runtime is unavailable: " << message;
            print_report(scorer::make_error_report(message));
            return scorer::E_INTERNAL_ERROR;
        }
    }

    try {
        const scorer::language& lang = scorer::default_language();
        scorer::docker_launcher launcher(lang);
        scorer::batch_scorer batch(launcher, lang);

        scorer::batch_result result = batch.score(request.code, request.test_cases);
        optional<scorer::submission_record> record;
        if (request.session)
            record = scorer::make_submission_record(result, move(*request.session));

        LOG(INFO) << "Scored " << result.verdicts.size() << " test cases, all accepted: " << boolalpha << result.all_accepted;
        print_report(scorer::make_report(result, record));
        return scorer::E_SUCCESS;
    } catch (scorer::scorer_exception& e) {
        LOG(ERROR) << "Scoring failed: " << e.what() << endl
                   << e;
        print_report(scorer::make_error_report(e.what()));
        return scorer::E_INTERNAL_ERROR;
    } catch (std::exception& e) {
        LOG(ERROR) << "Scoring failed: " << e.what() << endl
                   << boost::diagnostic_information(e);
        print_report(scorer::make_error_report(e.what()));
        return scorer::E_INTERNAL_ERROR;
    }
}
