#include "cli_options.h"
#include <algorithm>
#include <getopt.h>
#include <sstream>
#include <stdexcept>

namespace picmod_cli {

namespace {

// 逗号分隔的整数列表
bool splitInts(const std::string& s, std::vector<int>& out) {
    out.clear();
    if (s.empty()) {
        return false;
    }
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
        try {
            size_t pos = 0;
            int v = std::stoi(item, &pos);
            if (pos != item.size()) {
                return false;
            }
            out.push_back(v);
        } catch (const std::logic_error&) {
            return false;
        }
    }
    return !out.empty() && s.back() != ',';
}

bool parseInt(const char* s, int& out) {
    try {
        size_t pos = 0;
        out = std::stoi(s, &pos);
        return pos == std::string(s).size();
    } catch (const std::logic_error&) {
        return false;
    }
}

} // namespace

const std::vector<std::string>& Commands() {
    static const std::vector<std::string> commands = {
        "stitch", "fill", "ocr", "erase-text", "replace-text", "add-text", "fonts", "info"
    };
    return commands;
}

bool NeedsInput(const std::string& command) {
    return command != "fonts";
}

bool ParseRect(const std::string& s, picmod::SelectionRect& out) {
    std::vector<int> v;
    if (!splitInts(s, v) || v.size() != 4) {
        return false;
    }
    out = picmod::SelectionRect(v[0], v[1], v[2], v[3]);
    return true;
}

bool ParseColor(const std::string& s, cv::Vec3b& out) {
    std::vector<int> v;
    if (!splitInts(s, v) || v.size() != 3) {
        return false;
    }
    for (int c : v) {
        if (c < 0 || c > 255) {
            return false;
        }
    }
    out = cv::Vec3b(static_cast<uchar>(v[0]), static_cast<uchar>(v[1]), static_cast<uchar>(v[2]));
    return true;
}

bool ParseIndices(const std::string& s, std::vector<int>& out) {
    if (!splitInts(s, out)) {
        return false;
    }
    return std::all_of(out.begin(), out.end(), [](int i) { return i >= 0; });
}

bool ParseCommandLine(int argc, char* argv[], CliOptions& options, std::string& error_msg) {
    static struct option long_options[] = {
        {"output",    required_argument, 0, 'o'},
        {"rect",      required_argument, 0, 'r'},
        {"mode",      required_argument, 0, 'm'},
        {"color",     required_argument, 0, 'c'},
        {"text",      required_argument, 0, 't'},
        {"font",      required_argument, 0, 'f'},
        {"size",      required_argument, 0, 's'},
        {"index",     required_argument, 0, 'i'},
        {"quality",   required_argument, 0, 'q'},
        {"config",    required_argument, 0, 'C'},
        {"log-dir",   required_argument, 0, 'l'},
        {"visualize", no_argument,       0, 'V'},
        {"help",      no_argument,       0, 'h'},
        {0, 0, 0, 0}
    };

    // 允许重复解析
    optind = 0;
    opterr = 0;

    int opt;
    int option_index = 0;
    while ((opt = getopt_long(argc, argv, "o:r:m:c:t:f:s:i:q:C:l:Vh", long_options, &option_index)) != -1) {
        switch (opt) {
            case 'o':
                options.output = optarg;
                break;
            case 'r': {
                picmod::SelectionRect rect;
                if (!ParseRect(optarg, rect)) {
                    error_msg = std::string("Invalid --rect '") + optarg + "', expected x1,y1,x2,y2";
                    return false;
                }
                options.rect = rect;
                break;
            }
            case 'm':
                options.mode = optarg;
                break;
            case 'c': {
                cv::Vec3b color;
                if (!ParseColor(optarg, color)) {
                    error_msg = std::string("Invalid --color '") + optarg + "', expected r,g,b in 0-255";
                    return false;
                }
                options.color = color;
                break;
            }
            case 't':
                options.text = optarg;
                break;
            case 'f':
                options.font = optarg;
                break;
            case 's':
                if (!parseInt(optarg, options.size) || options.size <= 0) {
                    error_msg = std::string("Invalid --size '") + optarg + "'";
                    return false;
                }
                break;
            case 'i':
                if (!ParseIndices(optarg, options.indices)) {
                    error_msg = std::string("Invalid --index '") + optarg + "'";
                    return false;
                }
                break;
            case 'q':
                if (!parseInt(optarg, options.quality) || options.quality < 1 || options.quality > 100) {
                    error_msg = std::string("Invalid --quality '") + optarg + "', expected 1-100";
                    return false;
                }
                break;
            case 'C':
                options.configPath = optarg;
                break;
            case 'l':
                options.logDir = optarg;
                break;
            case 'V':
                options.visualize = true;
                break;
            case 'h':
                options.help = true;
                return true;
            default:
                error_msg = "Unknown or incomplete option";
                return false;
        }
    }

    std::vector<std::string> positional(argv + optind, argv + argc);
    if (positional.empty()) {
        error_msg = "Missing command";
        return false;
    }

    options.command = positional[0];
    const auto& commands = Commands();
    if (std::find(commands.begin(), commands.end(), options.command) == commands.end()) {
        error_msg = "Unknown command '" + options.command + "'";
        return false;
    }

    if (NeedsInput(options.command)) {
        if (positional.size() != 2) {
            error_msg = "Command '" + options.command + "' takes exactly one input image";
            return false;
        }
        options.input = positional[1];
    } else if (positional.size() != 1) {
        error_msg = "Command '" + options.command + "' takes no input";
        return false;
    }

    // 命令相关的必需参数
    if ((options.command == "stitch" || options.command == "fill" || options.command == "add-text")
        && !options.rect) {
        error_msg = "Command '" + options.command + "' requires --rect";
        return false;
    }
    if ((options.command == "replace-text" || options.command == "add-text") && options.text.empty()) {
        error_msg = "Command '" + options.command + "' requires --text";
        return false;
    }

    return true;
}

std::string Usage(const std::string& program) {
    std::ostringstream os;
    os << "Usage: " << program << " <command> [options] <input>\n"
       << "Commands:\n"
       << "  stitch        Delete the selected rows and join the remaining parts\n"
       << "  fill          Fill the selection (inpaint|average|median|color)\n"
       << "  ocr           Recognize text in the selection, print a JSON report\n"
       << "  erase-text    Recognize, then erase text in the selection or by --index\n"
       << "  replace-text  Recognize, then replace one text line with --text\n"
       << "  add-text      Draw --text centered in --rect\n"
       << "  fonts         List available fonts\n"
       << "  info          Print image size and format\n"
       << "Options:\n"
       << "  -o, --output <path>      Output image (default: <input>_edited.<ext>)\n"
       << "  -r, --rect <x1,y1,x2,y2> Selection (default for OCR commands: whole image)\n"
       << "  -m, --mode <mode>        Fill mode (default: inpaint)\n"
       << "  -c, --color <r,g,b>      Fill or text color\n"
       << "  -t, --text <text>        New text (UTF-8)\n"
       << "  -f, --font <name|path>   Font name or font file\n"
       << "  -s, --size <px>          Font size\n"
       << "  -i, --index <i[,j...]>   Text line indices from the OCR report\n"
       << "  -q, --quality <1-100>    JPEG/WebP quality\n"
       << "  -C, --config <path>      JSON configuration file\n"
       << "  -l, --log-dir <path>     Also write logs to this directory\n"
       << "  -V, --visualize          Write a visualization image\n"
       << "  -h, --help               Show this help message\n"
       << "Exit status: 0 success, 1 usage error, 2 processing error\n";
    return os.str();
}

} // namespace picmod_cli
