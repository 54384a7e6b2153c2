/**
 * Examples for enumkit runtime enums
 *
 * This file walks through the library:
 * 1. Creating items with auxiliary data
 * 2. Assembling and registering an enum
 * 3. Building an enum from a name -> data mapping
 * 4. Identity equality and rendering
 * 5. Looking enums up through the process-wide registry
 * 6. Handling construction errors
 *
 * Set SPDLOG_LEVEL=debug to see the library's own log output.
 */

#include <iostream>
#include <string>

#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

#include "enumkit/enumkit.hpp"

using enumkit::json;

int main() {
    spdlog::cfg::load_env_levels();

    std::cout << "=== 1. Creating items ===" << std::endl;
    auto red = enumkit::createItem("Color", "Red",
                                   {{"Hex", "#FF0000"}, {"Warm", true}});
    auto green = enumkit::createItem("Color", "Green", {{"Hex", "#00FF00"}});
    auto blue = enumkit::createItem("Color", "Blue", {{"Hex", "#0000FF"}});
    std::cout << red << " hex=" << red.value<std::string>("Hex") << std::endl;

    std::cout << "\n=== 2. Assembling an enum ===" << std::endl;
    auto color = enumkit::createEnum("Color", {red, green, blue});
    std::cout << color << " has " << color.size() << " members:" << std::endl;
    for (const auto& item : color.getEnumItems()) {
        std::cout << "  " << item << " " << item.data().dump() << std::endl;
    }

    std::cout << "\n=== 3. Enum from a mapping ===" << std::endl;
    auto size = enumkit::createEnumFromMapping(
        "Size", {{"Small", {{"Inches", 8}}},
                 {"Medium", {{"Inches", 12}}},
                 {"Large", {{"Inches", 16}}}});
    for (const auto& name : size.names()) {
        std::cout << "  " << size[name] << " -> "
                  << size[name].value<int>("Inches") << " in" << std::endl;
    }

    std::cout << "\n=== 4. Identity ===" << std::endl;
    auto lookalike = enumkit::createItem("Color", "Red", {{"Hex", "#FF0000"}});
    std::cout << std::boolalpha;
    std::cout << "color[\"Red\"] == red:       " << (color["Red"] == red)
              << std::endl;
    std::cout << "lookalike == red:           " << (lookalike == red)
              << std::endl;
    std::cout << "color.contains(lookalike):  " << color.contains(lookalike)
              << std::endl;

    std::cout << "\n=== 5. Registry ===" << std::endl;
    if (auto found = enumkit::enums()["Size"]) {
        std::cout << "Found " << *found << " equal to size: "
                  << (*found == size) << std::endl;
    }
    for (const auto& [name, value] : enumkit::enums().getEnums()) {
        std::cout << "  " << name << " -> " << value << std::endl;
    }

    std::cout << "\n=== 6. Errors ===" << std::endl;
    try {
        enumkit::createEnum("Color", {});
    } catch (const enumkit::core::DuplicateEnum& e) {
        std::cout << "DuplicateEnum: " << e.getMessage() << std::endl;
    }
    try {
        enumkit::createEnum("Shape",
                            {enumkit::createItem("Color", "Circle")});
    } catch (const enumkit::core::EnumTypeMismatch& e) {
        std::cout << "EnumTypeMismatch: " << e.getMessage() << std::endl;
    }
    try {
        enumkit::createItem("Shape", "Square", {{"Name", "Box"}});
    } catch (const enumkit::core::ReservedKeyError& e) {
        std::cout << "ReservedKeyError: " << e.getMessage() << std::endl;
    }

    return 0;
}
