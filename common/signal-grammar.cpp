#include "signal-grammar.h"

#include <string>

pcomb_parser common_signal_grammar() {
    return build_pcomb_parser([](pcomb_builder & p) {
        auto qty = p.map(p.regex("\\d+"), [](pcomb_node & n) {
            n.value = std::stoll(n.token);
        });
        auto item = p.map(p.named_regex("item", "eggs|chickens"), [](pcomb_node & n) {
            n.value = n.token;
        });
        auto noise = p.regex("\\S+");

        // signal_seq stops after the last signal, the rest is trailing noise
        return p.map(p.seq({p.signal_seq(noise, {qty, item}), p.many(noise)}), [](pcomb_node & n) {
            const auto signals = n.children[0].without_noise();
            n.value = {
                {"quantity", signals.children[0].value},
                {"item",     signals.children[1].value},
            };
        });
    });
}
