// main.cpp
// graphser walkthrough - serializing a small game save
//
// Shows the pieces a typical caller touches:
//
// Step 1: building a value graph with shared and cyclic tables
// Step 2: plain, hook and template types in a registry
// Step 3: resources and named functions
// Step 4: decoding and checking the graph came back intact

#include <graphser/errors.h>
#include <graphser/function.h>
#include <graphser/serialization.h>
#include <graphser/value_compare.h>

#include <cmath>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace graphser;

namespace {

void print_hex(const ByteBuffer& buffer)
{
    std::cout << "  " << buffer.size() << " bytes:";
    for (std::size_t i = 0; i < buffer.size() && i < 48; ++i) {
        std::cout << ' ' << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(buffer[i]);
    }
    if (buffer.size() > 48)
        std::cout << " ...";
    std::cout << std::dec << std::setfill(' ') << "\n";
}

// ============================================================
// Registry Setup
// ============================================================

void register_types(Registry& registry)
{
    // Items keep their fields verbatim, only the type tag is restored
    registry.register_type(TypeDescriptor::plain("Item"));

    // Vectors travel as a compact "x y" string
    registry.register_type(TypeDescriptor::with_hooks(
        "Vec2",
        [](const Value& v) {
            const Table* t = v.as_table();
            return Value{std::to_string(t->get("x").as_number()) + " " + std::to_string(t->get("y").as_number())};
        },
        [](const Value& text) {
            const std::string s{text.as_string_view()};
            const auto space = s.find(' ');
            auto vec = Table::make_typed("Vec2");
            vec->set("x", std::stod(s.substr(0, space)));
            vec->set("y", std::stod(s.substr(space + 1)));
            return Value{vec};
        }));

    // Stats are written positionally, the keys never hit the wire
    registry.register_type(TypeDescriptor::with_template(
        "Stats", Template{"hp", "mp", {"attributes", Template{"str", "dex", "int"}}}));
}

} // namespace

int main()
{
    std::cout << "=== graphser basic example ===\n\n";

    Registry registry;
    register_types(registry);

    // --------------------------------------------------------
    // Step 1 + 2: the save graph
    // --------------------------------------------------------
    auto sword = Table::make_typed("Item");
    sword->set("name", "Short Sword").set("damage", 7);

    auto position = Table::make_typed("Vec2");
    position->set("x", 12.5).set("y", -3);

    auto stats = Table::make_typed("Stats");
    stats->set("hp", 42).set("mp", 10);
    stats->set("attributes", Table::make({}, {{"str", 14}, {"dex", 12}, {"int", 9}}));
    stats->set("level", 3); // not in the template, carried as a remainder entry

    auto player = Table::make({sword, sword}, {{"name", "Ayla"}, {"pos", position}, {"stats", stats}});
    player->set("self", player);

    // --------------------------------------------------------
    // Step 3: resources and functions
    // --------------------------------------------------------
    auto world = Table::make({}, {{"name", "Overworld"}});
    registry.register_resource(world, "world");
    player->set("world", world);

    auto codec = std::make_shared<NamedFunctionCodec>();
    codec->add("damage_roll", [](const std::vector<Value>& args) {
        const double base = args.empty() ? 0.0 : args[0].as_number();
        return Value{std::floor(base * 1.5)};
    });
    registry.set_function_codec(codec);
    player->set("on_hit", codec->make("damage_roll"));

    std::cout << "Original:\n  " << to_string(player) << "\n\n";

    // --------------------------------------------------------
    // Step 4: round trip
    // --------------------------------------------------------
    try {
        ByteBuffer buffer = encode(std::vector<Value>{player, sword}, registry);
        std::cout << "Encoded:\n";
        print_hex(buffer);

        std::vector<Value> values = decode(buffer, registry);
        const Table* out = values[0].as_table();

        std::cout << "\nDecoded:\n  " << to_string(values[0]) << "\n\n";
        std::cout << "deep_equal:          " << std::boolalpha << deep_equal(player, values[0]) << "\n";
        std::cout << "self-cycle restored: " << (out->get("self") == values[0]) << "\n";
        std::cout << "sword shared:        " << (out->get(1) == values[1] && out->get(2) == values[1]) << "\n";
        std::cout << "world is live:       " << (out->get("world") == Value{world}) << "\n";
        std::cout << "on_hit(10):          " << out->get("on_hit").as_function()->call(10).as_number() << "\n";

        values[0].as_table()->clear();
    } catch (const Error& e) {
        std::cerr << "graphser error (" << to_string(e.code()) << "): " << e.what() << "\n";
        player->clear();
        return 1;
    }

    player->clear();
    return 0;
}
