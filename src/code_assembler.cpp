#include "code_assembler.hpp"
#include <sstream>

static const char* const kSavedMarker = "[Plot saved to ";
static const char* const kSaveErrorMarker = "[Error saving plot";

static std::string build_preamble() {
    const std::string file = kArtifactFilename;
    std::ostringstream py;
    py << "import sys as _codebox_sys\n"
       << "try:\n"
       << "    import matplotlib as _codebox_mpl\n"
       << "    _codebox_mpl.use('Agg')\n"
       << "    import matplotlib.pyplot as _codebox_plt\n"
       << "except ImportError:\n"
       << "    _codebox_plt = None\n"
       << "\n"
       << "if _codebox_plt is not None:\n"
       << "    _codebox_plot_saved = False\n"
       << "\n"
       << "    def _codebox_show(*args, **kwargs):\n"
       << "        global _codebox_plot_saved\n"
       << "        if not _codebox_plot_saved:\n"
       << "            _codebox_plot_saved = True\n"
       << "            try:\n"
       << "                _codebox_plt.savefig('" << file << "')\n"
       << "                print('" << kSavedMarker << file << "]', file=_codebox_sys.stderr)\n"
       << "            except Exception as _codebox_err:\n"
       << "                print('" << kSaveErrorMarker << ": %s]' % _codebox_err, file=_codebox_sys.stderr)\n"
       << "        _codebox_plt.close()\n"
       << "\n"
       << "    _codebox_plt.show = _codebox_show\n"
       << "\n";
    return py.str();
}

const std::string& instrumentation_preamble() {
    static const std::string preamble = build_preamble();
    return preamble;
}

std::string assemble_script(const std::string& user_code) {
    return instrumentation_preamble() + user_code;
}

std::string filter_instrumentation_lines(const std::string& stderr_text) {
    std::istringstream in(stderr_text);
    std::string line, out;
    bool first = true;
    while (std::getline(in, line)) {
        if (line.rfind(kSavedMarker, 0) == 0 || line.rfind(kSaveErrorMarker, 0) == 0) continue;
        if (!first) out += "\n";
        out += line;
        first = false;
    }
    return out;
}
