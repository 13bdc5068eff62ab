/*
 * Script rendering implementation - Shell-Gen
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shell-gen/render/render.hpp>
#include <shell-gen/quote/quote.hpp>
#include <algorithm>
#include <type_traits>

namespace shellgen {

namespace {

std::string strip_newlines(std::string t) {
    t.erase(std::remove(t.begin(), t.end(), '\n'), t.end());
    return t;
}

// Lines of a here-document as the shell reads them back from
// "<<EOF\nBODY\nEOF": every '\n' separates two lines.
std::vector<std::string> doc_lines(const std::string& body) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (true) {
        std::size_t nl = body.find('\n', start);
        if (nl == std::string::npos) { lines.push_back(body.substr(start)); break; }
        lines.push_back(body.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

// Descriptor prefix of a redirection; omitted when it is the operator's default.
std::string redir_fd(int fd, int default_fd) {
    return fd == default_fd ? std::string() : std::to_string(fd);
}

bool is_compound(const Expr& e) {
    return std::holds_alternative<PipeNode>(e.node) || std::holds_alternative<AndNode>(e.node) ||
           std::holds_alternative<OrNode>(e.node);
}

bool is_list(const Expr& e) {
    return std::holds_alternative<AndNode>(e.node) || std::holds_alternative<OrNode>(e.node);
}

class Renderer {
public:
    explicit Renderer(bool multiline) : m_multiline(multiline) {}

    // One top-level node, with the bodies of its here-documents after it.
    std::string line(const Expr& e) {
        std::string text = go(e);
        return text + flush();
    }

private:
    // `in_operand`: the node shares its line with an operator or redirection.
    std::string go(const Expr& e, bool in_operand = false) {
        return std::visit([this, in_operand](const auto& n) -> std::string {
            using T = std::decay_t<decltype(n)>;
            if constexpr (std::is_same_v<T, CmdNode>) {
                return n.text;
            } else if constexpr (std::is_same_v<T, CommentNode>) {
                return comment(n.text, in_operand);
            } else if constexpr (std::is_same_v<T, SubshellNode>) {
                return subshell(n);
            } else if constexpr (std::is_same_v<T, PipeNode>) {
                std::string l = operand(*n.left, is_list(*n.left));
                std::string r = operand(*n.right, is_list(*n.right));
                return l + " | " + r;
            } else if constexpr (std::is_same_v<T, AndNode>) {
                std::string l = go(*n.left, true);
                std::string r = operand(*n.right, is_list(*n.right));
                return l + " && " + r;
            } else if constexpr (std::is_same_v<T, OrNode>) {
                std::string l = go(*n.left, true);
                std::string r = operand(*n.right, is_list(*n.right));
                return l + " || " + r;
            } else {
                return redir(n);
            }
        }, e.node);
    }

    // Groups an operand that would otherwise bind to its neighbour.
    std::string operand(const Expr& e, bool group) {
        std::string t = go(e, true);
        return group ? "{ " + t + "; }" : t;
    }

    std::string comment(const std::string& text, bool in_operand) {
        // leading tabs come from indent() and stay in front of the marker
        std::size_t tabs = text.find_first_not_of('\t');
        if (tabs == std::string::npos) tabs = text.size();
        std::string lead = text.substr(0, tabs);
        std::string body = strip_newlines(text.substr(tabs));
        // a comment would swallow the rest of the line; use ':' instead
        if (m_multiline && !in_operand) return lead + "# " + body;
        return lead + ": " + quote(body).text();
    }

    std::string subshell(const SubshellNode& n) {
        std::string out = n.indent + "(";
        if (m_multiline) {
            out += flush() + "\n";
            for (std::size_t i = 0; i < n.body.size(); ++i) {
                if (i > 0) out += "\n";
                out += go(indent(n.body[i]));
                out += flush();
            }
            out += "\n";
        } else {
            for (std::size_t i = 0; i < n.body.size(); ++i) {
                if (i > 0) out += ";";
                out += go(indent(n.body[i]));
            }
        }
        return out + n.indent + ")";
    }

    std::string redir(const RedirNode& n) {
        const RedirSpec& r = n.spec;
        if (r.type == RedirSpec::Type::HereDoc && !m_multiline) {
            std::vector<Expr> echoes;
            for (auto& l : doc_lines(r.target)) echoes.push_back(make_cmd("echo " + quote(l).text()));
            Expr feed = make_subshell(std::move(echoes));
            return go(feed) + " | " + operand(*n.expr, is_list(*n.expr));
        }
        std::string t = operand(*n.expr, is_compound(*n.expr)) + " ";
        switch (r.type) {
            case RedirSpec::Type::ToFile:
                return t + redir_fd(r.fd, kStdout) + "> " + quote(r.target).text();
            case RedirSpec::Type::ToFileAppend:
                return t + redir_fd(r.fd, kStdout) + ">> " + quote(r.target).text();
            case RedirSpec::Type::FromFile:
                return t + redir_fd(r.fd, kStdin) + "< " + quote(r.target).text();
            case RedirSpec::Type::Output:
                return t + redir_fd(r.fd, kStdout) + ">&" + std::to_string(r.target_fd);
            case RedirSpec::Type::Input:
                return t + redir_fd(r.fd, kStdin) + "<&" + std::to_string(r.target_fd);
            case RedirSpec::Type::HereDoc:
                break;
        }
        std::string marker = eof_marker(r.target);
        m_pending.push_back(r.target + "\n" + marker);
        return t + "<<" + marker;
    }

    // Here-document bodies wait for the end of the line that opened them.
    std::string flush() {
        std::string out;
        for (auto& p : m_pending) out += "\n" + p;
        m_pending.clear();
        return out;
    }

    bool m_multiline;
    std::vector<std::string> m_pending;
};

} // namespace

std::string eof_marker(const std::string& body) {
    for (unsigned long n = 1;; ++n) {
        std::string marker = "EOF";
        if (n > 1) marker += std::to_string(n);
        if (body.find(marker) == std::string::npos) return marker;
    }
}

std::string render(RenderMode mode, const std::vector<Expr>& exprs) {
    Renderer r(mode == RenderMode::MultiLine);
    std::string out;
    if (mode == RenderMode::MultiLine) {
        out = "#!/bin/sh\n";
        for (auto& e : exprs) out += r.line(e) + "\n";
        return out;
    }
    for (std::size_t i = 0; i < exprs.size(); ++i) {
        if (i > 0) out += "; ";
        out += r.line(exprs[i]);
    }
    return out;
}

std::string linearize(const std::vector<Expr>& exprs) {
    return render(RenderMode::SingleLine, exprs);
}

std::string script(const Block& block) {
    return render(RenderMode::MultiLine, gen(block));
}

std::string linear_script(const Block& block) {
    return render(RenderMode::SingleLine, gen(block));
}

} // namespace shellgen
