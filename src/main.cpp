#include "app.hpp"
#include "main.hpp"
#include "state.hpp"
#include "feedback.hpp"
#include "settings.hpp"

#include <string>
#include <vector>
#include <iostream>


static void print_usage(const char* exe) {
    std::cerr << "Usage: " << exe << " [image]\n"
              << "       " << exe << " --export <dir> <image>\n"
              << "Settings are read from " << SETTINGS_FILE << std::endl;
}

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    try {
        Settings settings = Settings::load(SETTINGS_FILE);

        if (!args.empty() && args[0] == "--export") {
            if (args.size() != 3) {
                print_usage(argv[0]);
                return 2;
            }
            return App::export_pieces(settings, args[2], args[1]);
        }

        if (args.size() > 1 || (!args.empty() && (args[0] == "--help" || args[0] == "-h"))) {
            print_usage(argv[0]);
            return args.size() > 1 ? 2 : 0;
        }

        FileSessionStore store(SESSION_DIR);
        ConsoleFeedback feedback(settings.sound);

        App app(settings, store, feedback);
        return app.run(args.empty() ? "" : args[0]);
    }
    catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 2;
    }
    catch (const ImageLoadError& e) {
        std::cerr << "Image error: " << e.what() << std::endl;
        return 1;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
