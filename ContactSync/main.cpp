//
//  main.cpp
//  ContactSync
//
//  Command line entry point: init, sync, list, get and delete.
//

#include <iostream>
#include <string>
#include <cstring>
#include <functional>
#include <time.h>
#include <pthread.h>
#include <spawn.h>

#include <StanfordCPPLib/exceptions.h>
#include <curl/curl.h>
#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"
#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/ansicolor_sink.h"
#include "spdlog/sinks/stdout_sinks.h"
#include "optionparser.h"

#include "contactsync/constants.hpp"
#include "contactsync/contact_formatter.hpp"
#include "contactsync/contact_store.hpp"
#include "contactsync/contact_sync_worker.hpp"
#include "contactsync/contact_utils.hpp"
#include "contactsync/credential_store.hpp"
#include "contactsync/google_people_client.hpp"
#include "contactsync/oauth_flow.hpp"
#include "contactsync/oauth_token_endpoint.hpp"
#include "contactsync/oauth_token_manager.hpp"
#include "contactsync/spd_log_extensions.hpp"
#include "contactsync/sync_exception.hpp"
#include "contactsync/thread_utils.hpp"

extern char ** environ;

using namespace nlohmann;
using option::Option;
using option::ArgStatus;

static const int AUTHORIZATION_TIMEOUT_SECONDS = 5 * 60;

struct CArg: public option::Arg
{
    static ArgStatus Required(const Option& option, bool)
    {
        return option.arg == 0 ? option::ARG_ILLEGAL : option::ARG_OK;
    }
};

#define USAGE_STRING "USAGE: [CONTACTS_DIR=/path] contactsync [options] <command> [args]\n\n" \
    "Commands:\n" \
    "  init  \tSave Google OAuth client credentials and authorize access.\n" \
    "  sync  \tDownload all Google contacts.\n" \
    "  list  \tList all contacts (-o table|json|vcf).\n" \
    "  get <name|uid>  \tShow one contact (-o card|json|vcf).\n" \
    "  delete <name|uid>  \tDelete a contact locally and from Google.\n\n" \
    "Options:"

enum  optionIndex { UNKNOWN, HELP, VERBOSE, OUTPUT, CLIENT_ID, CLIENT_SECRET, YES };
const option::Descriptor usage[] =
{
    {UNKNOWN,       0,"" , "",              CArg::None,      USAGE_STRING },
    {HELP,          0,"" , "help",          CArg::None,      "  --help  \tPrint usage and exit." },
    {VERBOSE,       0,"v", "verbose",       CArg::None,      "  --verbose, -v  \tOptional: log to the console as well as the log file." },
    {OUTPUT,        0,"o", "output",        CArg::Required,  "  --output, -o  \tOptional: output format for list and get." },
    {CLIENT_ID,     0,"" , "client-id",     CArg::Required,  "  --client-id  \tOptional: Google OAuth client id for init." },
    {CLIENT_SECRET, 0,"" , "client-secret", CArg::Required,  "  --client-secret  \tOptional: Google OAuth client secret for init." },
    {YES,           0,"y", "yes",           CArg::None,      "  --yes, -y  \tOptional: delete without asking for confirmation." },
    {0,0,0,0,0,0}
};

int runSingleFunctionAndExit(std::function<void()> fn) {
    json resp = {{"error", nullptr}};
    try {
        fn();
        return 0;
    } catch (SyncException & ex) {
        spdlog::get("logger")->error("Command failed: {}", ex.toJSON().dump());
        resp["error"] = ex.what();
    } catch (std::exception & ex) {
        spdlog::get("logger")->error("Command failed: {}", ex.what());
        resp["error"] = ex.what();
    }
    std::cout << resp.dump() << std::endl;
    return 1;
}

std::string promptForValue(std::string label) {
    std::cerr << label << ": " << std::flush;
    std::string value;
    if (!std::getline(std::cin, value)) {
        throw SyncException(SYNC_KEY_INVALID_INPUT, label + " is required", false);
    }
    value = ContactUtils::trim(value);
    if (value == "") {
        throw SyncException(SYNC_KEY_INVALID_INPUT, label + " is required", false);
    }
    return value;
}

void openBrowser(std::string url) {
#ifdef __APPLE__
    const char * opener = "open";
#else
    const char * opener = "xdg-open";
#endif
    pid_t pid;
    char * argv[] = {(char *)opener, (char *)url.c_str(), nullptr};
    int err = posix_spawnp(&pid, opener, nullptr, nullptr, argv, environ);
    if (err != 0) {
        spdlog::get("logger")->warn("Could not launch {}: {}", opener, strerror(err));
    }
}

std::string argumentsAfterCommand(option::Parser & parse) {
    std::string query = "";
    for (int i = 1; i < parse.nonOptionsCount(); i++) {
        query += (i > 1 ? " " : "") + std::string(parse.nonOption(i));
    }
    if (query == "") {
        throw SyncException(SYNC_KEY_INVALID_INPUT, "missing argument: <name|uid>", false);
    }
    return query;
}

std::string outputFormat(Option * options, std::string fallback, std::vector<std::string> allowed) {
    std::string format = options[OUTPUT] ? ContactUtils::toLowerCase(options[OUTPUT].arg) : fallback;
    for (const auto & a : allowed) {
        if (a == format) {
            return format;
        }
    }
    throw SyncException(SYNC_KEY_INVALID_INPUT, "unknown output format \"" + format + "\"", false);
}

void runInit(Option * options, std::shared_ptr<CredentialStore> credStore) {
    auto existing = credStore->load();
    std::string clientId = options[CLIENT_ID] ? options[CLIENT_ID].arg : "";
    std::string clientSecret = options[CLIENT_SECRET] ? options[CLIENT_SECRET].arg : "";

    if (clientId == "" || clientSecret == "") {
        std::cerr << "Create an OAuth client (Desktop app) at console.cloud.google.com/apis/credentials\n"
                  << "with the People API enabled and the redirect URI http://localhost:8080/callback\n\n";
    }
    if (clientId == "") {
        clientId = promptForValue("Client ID");
    }
    if (clientSecret == "") {
        clientSecret = promptForValue("Client Secret");
    }

    auto creds = std::make_shared<Credentials>(ContactUtils::trim(clientId), ContactUtils::trim(clientSecret));
    if (existing && existing->clientId() == creds->clientId()) {
        creds->setEmail(existing->email());
    }
    credStore->save(creds);

    OAuthFlow flow(credStore, std::make_shared<GoogleTokenEndpoint>());
    std::string url = flow.start();
    std::cerr << "Opening browser for authorization...\nIf it doesn't open, visit:\n\n  " << url << "\n\nWaiting for authorization...\n";
    openBrowser(url);
    flow.waitForCompletion(AUTHORIZATION_TIMEOUT_SECONDS);
    std::cerr << "Authorization complete." << std::endl;
}

void runDelete(Option * options, ContactStore & store, std::string query) {
    auto contact = store.resolve(query);
    if (!contact) {
        throw SyncException(SYNC_KEY_NOT_FOUND, query, false);
    }
    if (!options[YES]) {
        std::cerr << "Delete \"" << contact->fullName() << "\"? [y/N] " << std::flush;
        std::string response;
        std::getline(std::cin, response);
        response = ContactUtils::toLowerCase(ContactUtils::trim(response));
        if (response != "y" && response != "yes") {
            std::cerr << "Cancelled." << std::endl;
            return;
        }
    }
    store.remove(contact->id());
    std::cerr << "Deleted." << std::endl;
}

int main(int argc, const char * argv[]) {
    // initialize the stanford exception handler
    exceptions::setProgramNameForStackTrace(argv[0]);
    exceptions::setTopLevelExceptionHandlerEnabled(true);

    // parse launch arguments, skip program name argv[0] if present
    argc-=(argc>0); argv+=(argc>0);
    option::Stats  stats(usage, argc, argv);
    option::Option options[20], buffer[20];
    option::Parser parse(usage, argc, argv, options, buffer);

    if (parse.error())
        return 1;

    if (options[HELP] || parse.nonOptionsCount() == 0) {
        option::printUsage(std::cout, usage);
        return options[HELP] ? 0 : 1;
    }

    std::string configDir;
    try {
        configDir = ContactUtils::configDirPath();
    } catch (SyncException & ex) {
        json resp = {{"error", ex.what()}};
        std::cout << resp.dump() << std::endl;
        return 1;
    }

    // setup logging to file, and to the console with --verbose
    std::vector<std::shared_ptr<spdlog::sinks::sink>> sinks;
    std::string logPath = configDir + FS_PATH_SEP + LOG_FILENAME;
    sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logPath, 1048576 * 5, 3));
    if (options[VERBOSE]) {
        sinks.push_back(std::make_shared<spdlog::sinks::ansicolor_stdout_sink_mt>());
    }

    // Always log critical errors to stderr as well.
    auto stderr_sink = std::make_shared<spdlog::sinks::stderr_sink_mt>();
    stderr_sink->set_level(spdlog::level::critical);
    sinks.push_back(stderr_sink);

    auto logger = spdlog::create("logger", std::begin(sinks), std::end(sinks));
    logger->set_formatter(SPDFormatterWithThreadNames("[%Y-%m-%d %H:%M:%S.%e] [%N] [%l] %v"));
    logger->flush_on(spdlog::level::warn);

    std::string level = ContactUtils::getEnvUTF8(LOG_LEVEL_ENV);
    if (level != "") {
        logger->set_level(spdlog::level::from_str(ContactUtils::toLowerCase(level)));
    } else if (options[VERBOSE]) {
        logger->set_level(spdlog::level::debug);
    }

    SetThreadName("main");

    // setup curl
    curl_global_init(CURL_GLOBAL_ALL);

    std::string command = parse.nonOption(0);
    logger->info("------------- contactsync {} ---------------", command);

    auto credStore = std::make_shared<CredentialStore>(configDir);

    int code = runSingleFunctionAndExit([&]() {
        if (command == "init") {
            runInit(options, credStore);
            return;
        }

        // The provider is only attached once authorization has produced a refresh token.
        std::shared_ptr<ContactProvider> provider = nullptr;
        auto creds = credStore->load();
        if (creds && creds->refreshToken() != "") {
            auto tokens = std::make_shared<OAuthTokenManager>(credStore, std::make_shared<GoogleTokenEndpoint>());
            provider = std::make_shared<GooglePeopleClient>(tokens, credStore);
        }
        ContactStore store(configDir, provider);

        if (command == "sync") {
            std::cerr << "Syncing contacts..." << std::endl;
            ContactSyncWorker worker(&store, provider);
            int count = worker.run();
            std::cerr << "Sync complete. " << count << " contacts." << std::endl;

        } else if (command == "list") {
            std::string format = outputFormat(options, "table", {"table", "json", "vcf"});
            auto contacts = store.findAll();
            if (format == "json") {
                std::cout << ContactFormatter::toJSON(contacts).dump(2) << std::endl;
            } else if (format == "vcf") {
                std::cout << ContactFormatter::formatVCF(contacts);
            } else if (contacts.size() == 0) {
                std::cerr << "No contacts found." << std::endl;
            } else {
                std::cout << ContactFormatter::formatTable(contacts);
            }

        } else if (command == "get") {
            std::string format = outputFormat(options, "card", {"card", "table", "json", "vcf"});
            std::string query = argumentsAfterCommand(parse);
            auto contact = store.resolve(query);
            if (!contact) {
                throw SyncException(SYNC_KEY_NOT_FOUND, query, false);
            }
            if (format == "json") {
                std::cout << ContactFormatter::toJSON(contact).dump(2) << std::endl;
            } else if (format == "vcf") {
                std::cout << contact->serialize();
            } else {
                std::cout << ContactFormatter::formatCard(contact) << std::endl;
            }

        } else if (command == "delete") {
            runDelete(options, store, argumentsAfterCommand(parse));

        } else {
            throw SyncException(SYNC_KEY_INVALID_INPUT, "unknown command \"" + command + "\"", false);
        }
    });

    curl_global_cleanup();
    spdlog::drop_all();
    return code;
}
