#include <lfrbench/NetworkExport.hpp>

#include <algorithm>
#include <cctype>
#include <istream>
#include <map>
#include <ostream>
#include <sstream>
#include <stdexcept>

namespace lfrbench {

static constexpr const char *kGmlComment = "LFR Benchmark Network";
static constexpr const char *kCsvNodeHeader = "id,label,community,degree,expected_degree";
static constexpr const char *kCsvEdgeHeader = "source,target,type,source_community,target_community";

static std::string default_label(node u) { return std::to_string(u); }

static std::string csv_quoted(const std::string &text) {
    std::string result = "\"";
    for (char c : text) {
        if (c == '"') result += '"';
        result += c;
    }
    return result + "\"";
}

// GML strings can not contain quotes; use the usual character entities instead
static std::string gml_escaped(const std::string &text) {
    std::string result;
    for (char c : text) {
        if (c == '&') {
            result += "&amp;";
        } else if (c == '"') {
            result += "&quot;";
        } else {
            result += c;
        }
    }
    return result;
}

static const char *edge_type(const CommunityAssignment &communities, node u, node v) {
    return communities.same_community(u, v) ? "intra" : "inter";
}

static void check_sizes(const AdjacencyGraph &graph, const CommunityAssignment &communities) {
    if (graph.num_nodes() != communities.num_nodes())
        throw std::invalid_argument("Graph and community assignment disagree on the number of nodes");
}

void write_gml(std::ostream &os, const AdjacencyGraph &graph, const CommunityAssignment &communities,
               const ExportMetadata &meta) {
    check_sizes(graph, communities);
    const auto &label = meta.labeler ? meta.labeler : NodeLabeler{default_label};

    os << "graph [\n"
       << "  directed " << (graph.is_directed() ? 1 : 0) << "\n"
       << "  comment \"" << kGmlComment << "\"\n"
       << "  avgDegree " << meta.avg_degree << "\n"
       << "  mu " << meta.mu << "\n\n";

    for (node u : graph.nodes()) {
        os << "  node [\n"
           << "    id " << u << "\n"
           << "    label \"" << gml_escaped(label(u)) << "\"\n"
           << "    community " << communities.community_of(u) << "\n"
           << "    degree " << graph.degree(u) << "\n"
           << "  ]\n";
    }

    os << "\n";

    for (auto [u, v] : graph.edges()) {
        os << "  edge [\n"
           << "    source " << u << "\n"
           << "    target " << v << "\n"
           << "    type \"" << edge_type(communities, u, v) << "\"\n"
           << "  ]\n";
    }

    os << "]\n";
}

void write_csv_nodes(std::ostream &os, const AdjacencyGraph &graph, const CommunityAssignment &communities,
                     const std::vector<count> &degree_sequence, const NodeLabeler &labeler) {
    check_sizes(graph, communities);
    if (degree_sequence.size() != graph.num_nodes())
        throw std::invalid_argument("Degree sequence must hold one entry per node");

    const auto &label = labeler ? labeler : NodeLabeler{default_label};

    os << kCsvNodeHeader << "\n";
    for (node u : graph.nodes()) {
        os << u << "," << csv_quoted(label(u)) << ","
           << communities.community_of(u) << ","
           << graph.degree(u) << ","
           << degree_sequence[u] << "\n";
    }
}

void write_csv_edges(std::ostream &os, const AdjacencyGraph &graph, const CommunityAssignment &communities) {
    check_sizes(graph, communities);

    os << kCsvEdgeHeader << "\n";
    for (auto [u, v] : graph.edges()) {
        os << u << "," << v << ","
           << edge_type(communities, u, v) << ","
           << communities.community_of(u) << ","
           << communities.community_of(v) << "\n";
    }
}

std::vector<community_id> ExportedNetwork::community_labels() const {
    std::vector<community_id> labels(nodes.size(), CommunityAssignment::kUnassigned);
    for (const auto &n : nodes) {
        if (n.id >= labels.size() || labels[n.id] != CommunityAssignment::kUnassigned)
            throw std::runtime_error("Node ids are not a permutation of [0, " + std::to_string(nodes.size()) + ")");
        if (n.community >= nodes.size())
            throw std::runtime_error("Community " + std::to_string(n.community) + " of node " + std::to_string(n.id) +
                                     " is not below the number of nodes " + std::to_string(nodes.size()));
        labels[n.id] = n.community;
    }
    return labels;
}

namespace {

[[noreturn]] void parse_error(std::size_t line, const std::string &what) {
    throw std::runtime_error("line " + std::to_string(line) + ": " + what);
}

uint64_t parse_unsigned(const std::string &text, std::size_t line) {
    if (text.empty() || !std::all_of(text.begin(), text.end(), [](char c) { return c >= '0' && c <= '9'; }))
        parse_error(line, "expected an unsigned integer but got '" + text + "'");
    try {
        return std::stoull(text);
    } catch (const std::out_of_range &) {
        parse_error(line, "integer out of range '" + text + "'");
    }
}

double parse_double(const std::string &text, std::size_t line) {
    std::size_t pos = 0;
    double value = 0;
    try {
        value = std::stod(text, &pos);
    } catch (const std::logic_error &) {
        parse_error(line, "expected a number but got '" + text + "'");
    }
    if (pos != text.size())
        parse_error(line, "expected a number but got '" + text + "'");
    return value;
}

bool parse_edge_type(const std::string &text, std::size_t line) {
    if (text == "intra") return true;
    if (text == "inter") return false;
    parse_error(line, "edge type must be intra or inter, got '" + text + "'");
}

std::string gml_unescaped(const std::string &text) {
    std::string result;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text.compare(i, 5, "&amp;") == 0) {
            result += '&';
            i += 4;
        } else if (text.compare(i, 6, "&quot;") == 0) {
            result += '"';
            i += 5;
        } else {
            result += text[i];
        }
    }
    return result;
}

struct GmlToken {
    std::string text;
    bool quoted;
    std::size_t line;
};

std::vector<GmlToken> tokenize_gml(std::istream &is) {
    std::vector<GmlToken> tokens;
    std::string line;
    std::size_t line_no = 0;

    while (std::getline(is, line)) {
        ++line_no;
        std::size_t i = 0;
        while (i < line.size()) {
            const char c = line[i];
            if (std::isspace(static_cast<unsigned char>(c))) {
                ++i;
            } else if (c == '[' || c == ']') {
                tokens.push_back({std::string(1, c), false, line_no});
                ++i;
            } else if (c == '"') {
                auto end = line.find('"', i + 1);
                if (end == std::string::npos)
                    parse_error(line_no, "unterminated string");
                tokens.push_back({line.substr(i + 1, end - i - 1), true, line_no});
                i = end + 1;
            } else {
                auto end = i;
                while (end < line.size() && !std::isspace(static_cast<unsigned char>(line[end]))
                       && line[end] != '[' && line[end] != ']')
                    ++end;
                tokens.push_back({line.substr(i, end - i), false, line_no});
                i = end;
            }
        }
    }

    return tokens;
}

class GmlParser {
public:
    explicit GmlParser(std::vector<GmlToken> tokens) : tokens_(std::move(tokens)) {}

    ExportedNetwork parse() {
        ExportedNetwork result;

        expect_word("graph");
        expect_bracket("[");

        while (!peek_is("]")) {
            const auto key = next();
            if (key.quoted) parse_error(key.line, "unexpected string");

            if (key.text == "node") {
                auto attrs = read_block();
                result.nodes.push_back({parse_unsigned(require(attrs, "id", key), key.line),
                                        attrs.count("label") ? gml_unescaped(attrs.at("label").text) : std::string{},
                                        parse_unsigned(require(attrs, "community", key), key.line),
                                        parse_unsigned(require(attrs, "degree", key), key.line),
                                        std::nullopt});
            } else if (key.text == "edge") {
                auto attrs = read_block();
                result.edges.push_back({parse_unsigned(require(attrs, "source", key), key.line),
                                        parse_unsigned(require(attrs, "target", key), key.line),
                                        parse_edge_type(require(attrs, "type", key), key.line)});
            } else {
                const auto value = next();
                if (key.text == "directed") {
                    result.directed = parse_unsigned(value.text, value.line) != 0;
                } else if (key.text == "avgDegree") {
                    result.avg_degree = parse_double(value.text, value.line);
                } else if (key.text == "mu") {
                    result.mu = parse_double(value.text, value.line);
                }
                // other graph attributes (comment, ...) are ignored
            }
        }

        expect_bracket("]");
        return result;
    }

private:
    std::vector<GmlToken> tokens_;
    std::size_t pos_{0};

    [[nodiscard]] std::size_t last_line() const {
        return tokens_.empty() ? 0 : tokens_.back().line;
    }

    const GmlToken &next() {
        if (pos_ >= tokens_.size())
            parse_error(last_line(), "unexpected end of input");
        return tokens_[pos_++];
    }

    [[nodiscard]] bool peek_is(const char *text) const {
        if (pos_ >= tokens_.size())
            parse_error(last_line(), "unexpected end of input");
        return !tokens_[pos_].quoted && tokens_[pos_].text == text;
    }

    void expect_word(const char *word) {
        const auto &tok = next();
        if (tok.quoted || tok.text != word)
            parse_error(tok.line, std::string("expected '") + word + "'");
    }

    void expect_bracket(const char *bracket) { expect_word(bracket); }

    std::map<std::string, GmlToken> read_block() {
        expect_bracket("[");
        std::map<std::string, GmlToken> attrs;
        while (!peek_is("]")) {
            const auto key = next();
            const auto value = next();
            if (!value.quoted && (value.text == "[" || value.text == "]"))
                parse_error(value.line, "nested blocks are not supported");
            attrs[key.text] = value;
        }
        expect_bracket("]");
        return attrs;
    }

    static const std::string &require(const std::map<std::string, GmlToken> &attrs, const char *name,
                                      const GmlToken &block) {
        auto it = attrs.find(name);
        if (it == attrs.end())
            parse_error(block.line, block.text + " block lacks '" + name + "'");
        return it->second.text;
    }
};

std::vector<std::string> split_csv_line(const std::string &line, std::size_t line_no) {
    std::vector<std::string> fields;
    std::string field;
    bool in_quotes = false;

    for (std::size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (in_quotes) {
            if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
                field += '"';
                ++i;
            } else if (c == '"') {
                in_quotes = false;
            } else {
                field += c;
            }
        } else if (c == '"') {
            in_quotes = true;
        } else if (c == ',') {
            fields.push_back(std::move(field));
            field.clear();
        } else if (c != '\r') {
            field += c;
        }
    }

    if (in_quotes)
        parse_error(line_no, "unterminated quoted field");

    fields.push_back(std::move(field));
    return fields;
}

template <typename Callback>
void for_each_csv_row(std::istream &is, const char *header, std::size_t num_fields, Callback cb) {
    std::string line;
    std::size_t line_no = 0;

    if (!std::getline(is, line))
        parse_error(0, "missing header");
    ++line_no;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line != header)
        parse_error(line_no, std::string("expected header '") + header + "'");

    while (std::getline(is, line)) {
        ++line_no;
        if (line.empty()) continue;

        auto fields = split_csv_line(line, line_no);
        if (fields.size() != num_fields)
            parse_error(line_no, "expected " + std::to_string(num_fields) + " fields but got " +
                                 std::to_string(fields.size()));
        cb(fields, line_no);
    }
}

}

ExportedNetwork read_gml(std::istream &is) {
    return GmlParser(tokenize_gml(is)).parse();
}

ExportedNetwork read_csv(std::istream &nodes, std::istream &edges) {
    ExportedNetwork result;

    for_each_csv_row(nodes, kCsvNodeHeader, 5, [&](const std::vector<std::string> &f, std::size_t line) {
        result.nodes.push_back({parse_unsigned(f[0], line), f[1], parse_unsigned(f[2], line),
                                parse_unsigned(f[3], line), parse_unsigned(f[4], line)});
    });

    for_each_csv_row(edges, kCsvEdgeHeader, 5, [&](const std::vector<std::string> &f, std::size_t line) {
        result.edges.push_back({parse_unsigned(f[0], line), parse_unsigned(f[1], line),
                                parse_edge_type(f[2], line)});
    });

    return result;
}

}
