#include "pcomb-impl.h"

#include <stdexcept>

// Finds the signals, in order, amid arbitrary noise. Plain noise is kept as
// children tagged with `noise`; noise that carries a value is kept untagged
// next to the signals. Noise after the last untagged child is not consumed.
//   S -> noise* A noise* B noise*
class signal_seq_parser : public pcomb_parser_base {
    pcomb_parser noise_;
    std::vector<pcomb_parser> signals_;

  public:
    static constexpr pcomb_parser_type type_value = PCOMB_PARSER_SIGNAL_SEQ;

    signal_seq_parser(const pcomb_parser & noise, std::vector<pcomb_parser> signals)
        : noise_(noise), signals_(std::move(signals)) {
        pcomb_require(noise_, "signal_seq");
        pcomb_require_all(signals_, "signal_seq");
    }

    pcomb_parser_type type() const override { return type_value; }

    void parse_impl(pcomb_state & ps, pcomb_node & node) const override {
        node.children.clear();

        const size_t start = ps.pos;
        size_t end = start;
        size_t kept = 0; // children up to and including the last untagged one
        size_t found = 0;

        pcomb_error pending; // last failure of signals_[found]
        size_t stop = start;

        for (;;) {
            const size_t attempt = ps.pos;

            if (found < signals_.size()) {
                pcomb_node child;
                signals_[found].parse(ps, child);
                if (!ps.errored()) {
                    node.children.push_back(std::move(child));
                    kept = node.children.size();
                    end = ps.pos;
                    found++;
                    continue;
                }
                if (ps.cut > attempt) {
                    node.children.clear();
                    ps.pos = start;
                    return;
                }
                pending = ps.error;
                ps.recover();
                ps.pos = attempt;
            }

            pcomb_node child;
            noise_.parse(ps, child);
            if (ps.errored()) {
                if (ps.cut > attempt) {
                    node.children.clear();
                    ps.pos = start;
                    return;
                }
                ps.recover();
                ps.pos = attempt;
                stop = attempt;
                break;
            }

            if (ps.pos == attempt) {
                stop = attempt;
                break;
            }

            if (child.value.is_null()) {
                child.noise = true;
                node.children.push_back(std::move(child));
            } else {
                node.children.push_back(std::move(child));
                kept = node.children.size();
                end = ps.pos;
            }
        }

        if (found < signals_.size()) {
            node.children.clear();
            if (pending.empty()) {
                ps.error = pcomb_error{stop, "noise"};
            } else {
                ps.error = pcomb_error{pending.pos, pending.expected + " or noise"};
            }
            ps.pos = start;
            return;
        }

        node.children.resize(kept);

        std::vector<std::string> tokens;
        tokens.reserve(node.children.size());
        for (const auto & child : node.children) {
            if (!child.noise) {
                tokens.push_back(child.token);
            }
        }
        node.token = string_join(tokens, " ");
        ps.pos = end;
    }

    std::string name() const override { return "SignalSeq()"; }

    std::string dump() const override {
        std::vector<std::string> parts;
        parts.reserve(signals_.size() + 1);
        parts.push_back(noise_.dump());
        for (const auto & s : signals_) {
            parts.push_back(s.dump());
        }
        return "SignalSeq(" + string_join(parts, ", ") + ")";
    }
};

pcomb_parser pcomb_builder::signal_seq(const pcomb_parser & noise, std::initializer_list<pcomb_parser> signals) {
    return signal_seq(noise, std::vector<pcomb_parser>(signals));
}

pcomb_parser pcomb_builder::signal_seq(const pcomb_parser & noise, const std::vector<pcomb_parser> & signals) {
    return pcomb_parser(std::make_shared<signal_seq_parser>(noise, signals));
}
