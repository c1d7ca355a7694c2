#include <catch2/catch.hpp>
#include "schemaupdate.hpp"
#include "fakes.hpp"

namespace {

    Column col(const std::string& name, const std::string& type, const std::string& path = "") {
        Column c;
        c.name = name;
        c.type = type;
        c.source_path = path;
        return c;
    }

    Schema target_schema() {
        Schema s;
        s.columns = { col("id", "bigint"), col("url", "string"), col("Referrer", "string") };
        return s;
    }

    TableMeta destination(std::vector<Column> columns) {
        TableMeta t;
        t.db = "db";
        t.name = "pageviews_orc";
        t.location = "/data/final";
        t.columns = std::move(columns);
        return t;
    }
}

TEST_CASE("Absent destination needs no evolution", "[evolution]") {
    HiveDDLVisitor ddl;
    Schema target = target_schema();
    std::optional<TableMeta> dest;

    SchemaUpdate update(target, dest, true);
    CHECK(update.plan_migration(ddl).empty());
    CHECK(update.table_columns().size() == 3);
}

TEST_CASE("Evolution enabled adds exactly the missing columns", "[evolution]") {
    HiveDDLVisitor ddl;
    Schema target = target_schema();
    std::optional<TableMeta> dest = destination({ col("ID", "bigint"), col("url", "string") });

    SchemaUpdate update(target, dest, true);
    auto ddls = update.plan_migration(ddl);
    REQUIRE(ddls.size() == 1);
    CHECK(ddls[0] == "ALTER TABLE `db`.`pageviews_orc` ADD COLUMNS (`Referrer` string)");
    REQUIRE(update.added_columns().size() == 1);
    CHECK(update.added_columns()[0].name == "Referrer");
}

TEST_CASE("New columns keep the target order", "[evolution]") {
    HiveDDLVisitor ddl;
    Schema target;
    target.columns = { col("c", "int"), col("a", "int"), col("b", "string") };
    std::optional<TableMeta> dest = destination({ col("a", "int") });

    SchemaUpdate update(target, dest, true);
    auto ddls = update.plan_migration(ddl);
    REQUIRE(ddls.size() == 1);
    CHECK(ddls[0] == "ALTER TABLE `db`.`pageviews_orc` ADD COLUMNS (`c` int, `b` string)");
}

TEST_CASE("Evolution never drops or retypes", "[evolution]") {
    HiveDDLVisitor ddl;
    Schema target;
    target.columns = { col("id", "string") };
    std::optional<TableMeta> dest = destination({ col("id", "bigint"), col("legacy", "string") });

    SchemaUpdate update(target, dest, true);
    CHECK(update.plan_migration(ddl).empty());

    auto cols = update.table_columns();
    REQUIRE(cols.size() == 2);
    CHECK(cols[0].name == "id");
    CHECK(cols[0].type == "bigint");
    CHECK(cols[1].name == "legacy");
}

TEST_CASE("Evolution disabled keeps the destination columns", "[evolution]") {
    HiveDDLVisitor ddl;
    Schema target;
    target.columns = { col("id", "bigint"), col("header__time", "bigint", "header.time"), col("extra", "int") };
    std::optional<TableMeta> dest = destination({ col("id", "bigint"), col("header__time", "bigint") });

    SchemaUpdate update(target, dest, false);
    CHECK(update.plan_migration(ddl).empty());
    CHECK(update.added_columns().empty());

    auto cols = update.table_columns();
    REQUIRE(cols.size() == 2);
    CHECK(cols[1].path() == "header.time");
}

TEST_CASE("Evolution enabled puts added columns after the destination ones", "[evolution]") {
    Schema target = target_schema();
    std::optional<TableMeta> dest = destination({ col("url", "string"), col("id", "bigint") });

    SchemaUpdate update(target, dest, true);
    auto cols = update.table_columns();
    REQUIRE(cols.size() == 3);
    CHECK(cols[0].name == "url");
    CHECK(cols[1].name == "id");
    CHECK(cols[2].name == "Referrer");
}
