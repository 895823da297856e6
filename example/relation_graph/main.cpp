// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Relata - Relation mapping and lifecycle hooks for record stores
 * Copyright (C) 2024 Max Qian
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#include "relata.hpp"

#include <iostream>

using namespace relata;

int main(int argc, char* argv[]) {
    try {
        auto config = argc > 1 ? config::loadConfigFile(argv[1])
                               : config::RelataConfig{};
        logging::initialize(config.logging);

        context::MappingContext ctx(config);

        ctx.define("Person", [](relation::RelationBuilder& r) {
            relation::ThroughRelationOptions clubs;
            clubs.through.extra = {"role"};
            r.hasMany("Pet");
            r.hasManyThrough("Club", clubs);
        });
        ctx.define("Pet", [](relation::RelationBuilder& r) {
            r.hasOne("Person", {.name = "owner",
                                .joinFrom = "Pet.personId",
                                .joinTo = "Person.id"});
        });
        ctx.define("Club");

        // Print the resolved graphs
        std::cout << ctx.describe().dump(2) << std::endl;

        engine::Session session(":memory:");
        session.execute(
            "CREATE TABLE Person (id INTEGER PRIMARY KEY, name TEXT,"
            " createdAt INTEGER, updatedAt INTEGER);"
            "CREATE TABLE Pet (id INTEGER PRIMARY KEY, name TEXT,"
            " personId INTEGER, createdAt INTEGER, updatedAt INTEGER);"
            "CREATE TABLE Club (id INTEGER PRIMARY KEY, name TEXT,"
            " createdAt INTEGER, updatedAt INTEGER);"
            "CREATE TABLE Person_Club (personId INTEGER, clubId INTEGER,"
            " role TEXT);");

        auto store = ctx.openStore(session);

        model::Record alice(ctx.kind("Person"), {{"name", "Alice"}});
        store->insert(alice);

        std::vector<model::Record> pets;
        for (const auto* name : {"Rex", "Tom"}) {
            pets.emplace_back(ctx.kind("Pet"),
                              json{{"name", name}, {"personId", alice.id()}});
        }
        store->insertAll(pets);

        model::Record chess(ctx.kind("Club"), {{"name", "Chess"}});
        store->insert(chess);
        auto link = session.prepare(
            "INSERT INTO Person_Club (personId, clubId, role) VALUES (?, ?, ?)");
        link->bind(1, alice.id()).bind(2, chess.id()).bind(3, "captain");
        link->execute();

        for (const auto& pet : store->related(alice, "pets")) {
            std::cout << "pet: " << pet.attributes().dump() << std::endl;
        }
        for (const auto& club : store->related(alice, "clubs")) {
            std::cout << "club: " << club.attributes().dump() << std::endl;
        }
        for (const auto& owner : store->related(pets.front(), "owner")) {
            std::cout << "owner of " << pets.front().get("name").dump() << ": "
                      << owner.get("name").dump() << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "relation_graph: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
