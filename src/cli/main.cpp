// =============================================================================
// mailclass CLI - train and evaluate mail classifiers
// =============================================================================
//
// Usage:
//   mailclass [global options] <command> [options]
//
// Commands:
//   new         Create an empty classifier snapshot
//   train       Learn labeled mailboxes into a snapshot
//   score       Score one message against a snapshot
//   classify    Score labeled mailboxes and print a confusion matrix
//   crossval    N-fold cross-validation over labeled mailboxes
//   config      Show or change the options stored in a snapshot
//   bias        Show or change a category bias
//   version     Show version information
//
// Examples:
//   mailclass new spam.model --combiner odds-product
//   mailclass train spam.model spam.mbox SPAM ham.mbox NONSPAM
//   mailclass score spam.model < message.eml
//   mailclass crossval -f 10 -t 0.9 spam.mbox SPAM ham.mbox NONSPAM
//
// =============================================================================

#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include "mailclass/bayes_classifier.hpp"
#include "mailclass/classifier.hpp"
#include "mailclass/config.hpp"
#include "mailclass/error.hpp"
#include "mailclass/harness.hpp"
#include "mailclass/io/mbox_source.hpp"
#include "mailclass/io/mime.hpp"
#include "mailclass/logging.hpp"

namespace mailclass::cli {
    int cmd_new(int argc, char* argv[]);
    int cmd_train(int argc, char* argv[]);
    int cmd_score(int argc, char* argv[]);
    int cmd_classify(int argc, char* argv[]);
    int cmd_crossval(int argc, char* argv[]);
    int cmd_config(int argc, char* argv[]);
    int cmd_bias(int argc, char* argv[]);
    int cmd_version(int argc, char* argv[]);
    int cmd_help(int argc, char* argv[]);
}

// =============================================================================
// Version Info
// =============================================================================

#define MAILCLASS_VERSION_STRING "1.0.0"

// =============================================================================
// Command Registry
// =============================================================================

struct Command {
    const char* name;
    const char* description;
    int (*handler)(int argc, char* argv[]);
};

static const Command g_commands[] = {
    {"new",      "Create an empty classifier snapshot", mailclass::cli::cmd_new},
    {"train",    "Learn labeled mailboxes into a snapshot", mailclass::cli::cmd_train},
    {"score",    "Score one message (file or stdin)", mailclass::cli::cmd_score},
    {"classify", "Score labeled mailboxes, print a confusion matrix", mailclass::cli::cmd_classify},
    {"crossval", "N-fold cross-validation over labeled mailboxes", mailclass::cli::cmd_crossval},
    {"config",   "Show or change snapshot options", mailclass::cli::cmd_config},
    {"bias",     "Show or change a category bias", mailclass::cli::cmd_bias},
    {"version",  "Show version information", mailclass::cli::cmd_version},
    {"help",     "Show this help message", mailclass::cli::cmd_help},
    {nullptr, nullptr, nullptr}
};

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    bool verbose = false;
    bool quiet = false;
    std::string log_file;
};

static GlobalOptions g_options;
static std::ofstream g_log_stream;

namespace mailclass::cli {

namespace {

// Positional "<mbox> <category>" pairs.
Corpus parse_corpus(const std::vector<std::string>& args) {
    MAILCLASS_CHECK_CONFIG(!args.empty() && args.size() % 2 == 0,
                           "Expected <mailbox> <category> pairs");
    Corpus corpus;
    for (size_t i = 0; i < args.size(); i += 2) {
        corpus.push_back({std::make_shared<io::MboxSource>(args[i]), args[i + 1]});
    }
    return corpus;
}

double parse_double(const std::string& text, const char* what) {
    Config config;
    config.set(what, text);
    return config.get_strict<double>(what);
}

int parse_int(const std::string& text, const char* what) {
    Config config;
    config.set(what, text);
    return config.get_strict<int>(what);
}

void print_matrix(const char* title, const ConfusionMatrix& matrix) {
    std::cout << "Results of " << title << ":\n" << matrix.report();
    std::cout << std::fixed << std::setprecision(2)
              << "Accuracy: " << matrix.accuracy() * 100.0 << "% of " << matrix.total() << " messages\n";
}

// Rebuild predictors before saving so that a loaded model scores without
// a refresh.
void finish_training(Classifier& classifier) {
    if (auto* bayes = dynamic_cast<BayesClassifier*>(&classifier)) {
        size_t n = bayes->update_predictors();
        LOG_DEBUG("Predictors rebuilt: ", n, " tokens");
    }
}

} // namespace

// =============================================================================
// Help Command
// =============================================================================

int cmd_help([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "mailclass - probabilistic mail classifier\n";
    std::cout << "Version " << MAILCLASS_VERSION_STRING << "\n\n";
    std::cout << "Usage: mailclass [global options] <command> [options]\n\n";
    std::cout << "Commands:\n";

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        std::cout << "  " << cmd->name;
        for (size_t i = strlen(cmd->name); i < 12; ++i) std::cout << ' ';
        std::cout << cmd->description << "\n";
    }

    std::cout << "\nGlobal Options:\n";
    std::cout << "  -v, --verbose           Debug logging\n";
    std::cout << "  -q, --quiet             Only warnings and errors\n";
    std::cout << "  --log-file <path>       Append log output to a file\n";
    std::cout << "\nCommand Options:\n";
    std::cout << "  new <model> [--classifier bayes|trivial] [--config <file>] [--disk]\n";
    std::cout << "              [--combiner chi-square|odds-product] [key=value ...]\n";
    std::cout << "  train <model> [--retrain] <mbox> <category> [...]\n";
    std::cout << "  score <model> [<message file>]\n";
    std::cout << "  classify <model> [-t <threshold>] <mbox> <category> [...]\n";
    std::cout << "  crossval [-m <model>] [-f <folds>] [-t <threshold>] [--seed <n>]\n";
    std::cout << "           <mbox> <category> [...]\n";
    std::cout << "  config <model> [key=value ...] [--load <file>] [--save <file>]\n";
    std::cout << "  bias <model> <category> [<value>]\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  MAILCLASS_LOG_LEVEL     DEBUG, INFO, WARN or ERROR\n";
    std::cout << "  MAILCLASS_LOG_FILE      Append log output to this file\n";
    return 0;
}

int cmd_version([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "mailclass " << MAILCLASS_VERSION_STRING << "\n";
    return 0;
}

// =============================================================================
// Model Commands
// =============================================================================

int cmd_new(int argc, char* argv[]) {
    std::string model;
    ClassifierKind kind = ClassifierKind::Bayes;
    Config config;

    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--classifier" && i + 1 < argc) {
            kind = parse_classifier_kind(argv[++i]);
        } else if (arg == "--config" && i + 1 < argc) {
            Config file;
            file.load_file(argv[++i]);
            config.merge(file);
        } else if (arg == "--disk") {
            config.set("on_disk", "1");
        } else if (arg == "--combiner" && i + 1 < argc) {
            config.set("combiner", argv[++i]);
        } else if (arg.find('=') != std::string::npos) {
            size_t eq = arg.find('=');
            config.set(arg.substr(0, eq), arg.substr(eq + 1));
        } else if (model.empty()) {
            model = arg;
        } else {
            std::cerr << "Unexpected argument: " << arg << "\n";
            return 1;
        }
    }
    if (model.empty()) {
        std::cerr << "Usage: mailclass new <model> [options]\n";
        return 1;
    }

    auto classifier = make_classifier(kind, ClassifierOptions::from_config(config));
    classifier->save(model);
    std::cout << "Created " << classifier_kind_name(kind) << " classifier " << model << "\n";
    return 0;
}

int cmd_train(int argc, char* argv[]) {
    std::string model;
    bool retrain = false;
    std::vector<std::string> rest;

    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--retrain") {
            retrain = true;
        } else if (model.empty()) {
            model = arg;
        } else {
            rest.push_back(arg);
        }
    }
    if (model.empty() || rest.empty()) {
        std::cerr << "Usage: mailclass train <model> [--retrain] <mbox> <category> [...]\n";
        return 1;
    }

    Corpus corpus = parse_corpus(rest);
    auto classifier = load_classifier(model);
    ClassifierHarness harness(*classifier);
    size_t learned = retrain ? harness.retrain(corpus) : harness.train(corpus);
    finish_training(*classifier);
    classifier->save(model);
    std::cout << "Learned " << learned << " messages\n";
    return 0;
}

int cmd_score(int argc, char* argv[]) {
    if (argc < 1) {
        std::cerr << "Usage: mailclass score <model> [<message file>]\n";
        return 1;
    }
    auto classifier = load_classifier(argv[0]);

    Document doc;
    if (argc >= 2) {
        std::ifstream file(argv[1], std::ios::binary);
        if (!file.is_open()) {
            MAILCLASS_THROW_RESOURCE(std::string("Can't open message ") + argv[1]);
        }
        doc = io::parse_message(file);
    } else {
        doc = io::parse_message(std::cin);
    }

    if (!classifier->is_valid(doc)) {
        std::cerr << "Message has no text content\n";
        return 1;
    }

    std::cout << std::fixed << std::setprecision(4);
    for (const auto& score : classifier->score(doc)) {
        std::cout << score.category << "\t" << score.probability << "\n";
    }
    return 0;
}

int cmd_classify(int argc, char* argv[]) {
    std::string model;
    double threshold = 0.9;
    std::vector<std::string> rest;

    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-t" || arg == "--threshold") && i + 1 < argc) {
            threshold = parse_double(argv[++i], "threshold");
        } else if (model.empty()) {
            model = arg;
        } else {
            rest.push_back(arg);
        }
    }
    if (model.empty() || rest.empty()) {
        std::cerr << "Usage: mailclass classify <model> [-t <threshold>] <mbox> <category> [...]\n";
        return 1;
    }

    Corpus corpus = parse_corpus(rest);
    auto classifier = load_classifier(model);
    ClassifierHarness harness(*classifier);
    print_matrix("classify", harness.classify(threshold, corpus));
    return 0;
}

int cmd_crossval(int argc, char* argv[]) {
    std::string model;
    int folds = 10;
    double threshold = 0.9;
    bool have_seed = false;
    uint32_t seed = 0;
    std::vector<std::string> rest;

    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-m" || arg == "--model") && i + 1 < argc) {
            model = argv[++i];
        } else if ((arg == "-f" || arg == "--folds") && i + 1 < argc) {
            folds = parse_int(argv[++i], "folds");
        } else if ((arg == "-t" || arg == "--threshold") && i + 1 < argc) {
            threshold = parse_double(argv[++i], "threshold");
        } else if (arg == "--seed" && i + 1 < argc) {
            int value = parse_int(argv[++i], "seed");
            MAILCLASS_CHECK_CONFIG(value >= 0, "seed must be >= 0");
            seed = static_cast<uint32_t>(value);
            have_seed = true;
        } else {
            rest.push_back(arg);
        }
    }
    if (rest.empty()) {
        std::cerr << "Usage: mailclass crossval [-m <model>] [-f <folds>] [-t <threshold>] "
                     "<mbox> <category> [...]\n";
        return 1;
    }

    Corpus corpus = parse_corpus(rest);
    // The snapshot only supplies options; crossval never writes it back.
    auto classifier = model.empty() ? make_classifier(ClassifierKind::Bayes) : load_classifier(model);
    ClassifierHarness harness(*classifier);

    std::mt19937 rng(have_seed ? seed : classifier->options().random_seed);
    print_matrix("crossval", harness.crossval(folds, threshold, corpus, rng));
    return 0;
}

int cmd_config(int argc, char* argv[]) {
    if (argc < 1) {
        std::cerr << "Usage: mailclass config <model> [key=value ...] [--load <file>] [--save <file>]\n";
        return 1;
    }
    const std::string model = argv[0];
    auto classifier = load_classifier(model);

    bool changed = false;
    Config updates;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--load" && i + 1 < argc) {
            classifier->load_config(argv[++i]);
            changed = true;
        } else if (arg == "--save" && i + 1 < argc) {
            classifier->save_config(argv[++i]);
        } else if (size_t eq = arg.find('='); eq != std::string::npos) {
            updates.set(arg.substr(0, eq), arg.substr(eq + 1));
        } else {
            std::cerr << "Unexpected argument: " << arg << "\n";
            return 1;
        }
    }
    if (!updates.values().empty()) {
        classifier->set_config(updates);
        changed = true;
    }
    if (changed) {
        classifier->save(model);
    }

    const Config current = classifier->options().to_config();
    for (const auto& [key, value] : current.values()) {
        std::cout << key << "=" << value << "\n";
    }
    return 0;
}

int cmd_bias(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: mailclass bias <model> <category> [<value>]\n";
        return 1;
    }
    const std::string model = argv[0];
    const std::string category = argv[1];
    auto classifier = load_classifier(model);
    auto* bayes = dynamic_cast<BayesClassifier*>(classifier.get());
    if (!bayes) {
        std::cerr << "Only bayes classifiers have biases\n";
        return 1;
    }

    if (argc >= 3) {
        if (!bayes->set_bias(category, parse_double(argv[2], "bias"))) {
            std::cerr << "Bias must be positive; keeping " << bayes->bias(category) << "\n";
            return 1;
        }
        bayes->update_predictors();
        bayes->save(model);
    }
    std::cout << category << "\t" << bayes->bias(category) << "\n";
    return 0;
}

}  // namespace mailclass::cli

// =============================================================================
// Main Entry Point
// =============================================================================

int parse_global_options(int& argc, char**& argv) {
    int i = 1;  // Skip program name
    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-v" || arg == "--verbose") {
            g_options.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            g_options.quiet = true;
        } else if (arg == "--log-file" && i + 1 < argc) {
            g_options.log_file = argv[++i];
        } else {
            // First non-option is the command
            break;
        }
        ++i;
    }

    argc -= i;
    argv += i;
    return 0;
}

static void apply_global_options() {
    mailclass::init_logging_from_env();
    if (g_options.verbose) {
        mailclass::set_log_level(mailclass::LogLevel::DEBUG);
    } else if (g_options.quiet) {
        mailclass::set_log_level(mailclass::LogLevel::WARN);
    }
    if (!g_options.log_file.empty()) {
        g_log_stream.open(g_options.log_file, std::ios::app);
        if (g_log_stream.is_open()) {
            mailclass::set_log_output(g_log_stream);
        } else {
            LOG_WARN("Can't open log file ", g_options.log_file, ", logging to stderr");
        }
    }
}

int main(int argc, char* argv[]) {
    parse_global_options(argc, argv);
    apply_global_options();

    if (argc < 1) {
        mailclass::cli::cmd_help(0, nullptr);
        return 1;
    }

    const char* cmd_name = argv[0];
    ++argv;
    --argc;

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        if (strcmp(cmd->name, cmd_name) == 0) {
            try {
                return cmd->handler(argc, argv);
            } catch (const mailclass::MailclassException& e) {
                LOG_ERROR(e.what());
                std::cerr << e.what() << "\n";
                return 2;
            }
        }
    }

    std::cerr << "Unknown command: " << cmd_name << "\n";
    std::cerr << "Run 'mailclass help' for usage.\n";
    return 1;
}
