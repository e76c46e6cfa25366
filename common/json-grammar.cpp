#include "json-grammar.h"

pcomb_parser common_json_grammar() {
    return build_pcomb_parser([](pcomb_builder & p) {
        auto value = p.rule("value");

        auto str = p.string_lit("\"");

        // "key" : value
        auto member = p.seq({str, ":", p.cut(), value});

        auto object = p.map(p.seq({"{", p.cut(), p.many(member, ","), "}"}), [](pcomb_node & n) {
            pcomb_value obj = pcomb_value::object();
            for (const auto & m : n.children[2].children) {
                obj[m.children[0].value.get<std::string>()] = m.children[3].value;
            }
            n.value = std::move(obj);
        });

        auto array = p.map(p.seq({"[", p.cut(), p.many(value, ","), "]"}), [](pcomb_node & n) {
            pcomb_value arr = pcomb_value::array();
            for (const auto & item : n.children[2].children) {
                arr.push_back(item.value);
            }
            n.value = std::move(arr);
        });

        p.add_rule("value", p.any_with_name("value", {
            p.bind("null", nullptr),
            p.bind("true", true),
            p.bind("false", false),
            str,
            p.number_lit(),
            array,
            object,
        }));

        return value;
    });
}

pcomb_value common_json_parse(std::string_view input) {
    static const pcomb_parser grammar = common_json_grammar();
    return pcomb_parse(grammar, input);
}
