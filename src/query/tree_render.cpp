#include <calltree/query/tree_render.hpp>

namespace calltree {

static const char* const kBranch = "├── ";
static const char* const kPipe = "│   ";
static const char* const kLastBranch = "└── ";
static const char* const kBlank = "    ";

std::string format_label(const TreeNode& node, bool verbose) {
    if (!verbose || node.file_info.empty()) return node.name;
    return node.name + "\t[" + node.file_info + "]";
}

static void render_into(const TreeNode& node, bool verbose, std::vector<std::string>& out) {
    out.push_back(format_label(node, verbose));
    for (size_t i = 0; i < node.children.size(); ++i) {
        bool last = i + 1 == node.children.size();
        std::vector<std::string> sub;
        render_into(node.children[i], verbose, sub);
        for (size_t j = 0; j < sub.size(); ++j) {
            const char* prefix = j == 0 ? (last ? kLastBranch : kBranch)
                                        : (last ? kBlank : kPipe);
            out.push_back(prefix + sub[j]);
        }
    }
}

std::vector<std::string> render_tree(const TreeNode& root, bool verbose) {
    std::vector<std::string> lines;
    render_into(root, verbose, lines);
    return lines;
}

} // namespace calltree
