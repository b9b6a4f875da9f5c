// file      : tests/transformer.cxx
// license   : GNU GPL v3; see accompanying LICENSE file

#include <memory> // std::unique_ptr
#include <string>
#include <vector>

#include <catch2/catch.hpp>

#include "common.hxx"

using namespace std;

namespace
{
  char const shop[] =
    "CREATE TABLE Users (\n"
    "  Id INT IDENTITY NOT NULL PRIMARY KEY,\n"
    "  Email NVARCHAR(100) NOT NULL,\n"
    "  Nick NVARCHAR(20) NULL);\n"
    "CREATE TABLE sales.Orders (\n"
    "  Id INT NOT NULL PRIMARY KEY,\n"
    "  UserId INT NOT NULL REFERENCES dbo.Users (Id),\n"
    "  Total DECIMAL(10,2) NOT NULL);\n"
    "CREATE VIEW UserNames (Id, Name) AS SELECT Id, Email FROM Users;\n";

  vector<string>
  rules ()
  {
    vector<string> r;
    r.push_back ("--type-map");
    r.push_back ("INT=std::int32_t");
    r.push_back ("--type-map");
    r.push_back ("NVARCHAR=std::string");
    return r;
  }
}

TEST_CASE ("row entities", "[transformer]")
{
  options o (parse_options (rules ()));

  diagnostics d;
  unique_ptr<target::model> m (transform_sql (shop, o, d));

  REQUIRE (m.get () != 0);
  REQUIRE (m->ents.size () == 3);

  target::entity const& u (m->ents[0]);
  CHECK (u.kind == target::entity::table);
  CHECK (u.schema == "dbo");
  CHECK (u.name == "Users");
  CHECK (u.qualified == "dbo.Users");
  CHECK (u.class_name == "Users");
  CHECK (u.schema_ns == "dbo");
  REQUIRE (u.props.size () == 3);

  CHECK (u.props[0].name == "Id");
  CHECK (u.props[0].type == "std::int32_t");
  CHECK (u.props[0].primary);
  CHECK (u.props[0].identity);
  CHECK (!u.props[0].null);

  CHECK (u.props[1].name == "Email");
  CHECK (u.props[1].source_type == "NVARCHAR(100)");
  CHECK (u.props[1].type == "std::string");

  CHECK (u.props[2].name == "Nick");
  CHECK (u.props[2].null);
  CHECK (u.props[2].ordinal == 2);

  target::entity const& o_ (m->ents[1]);
  CHECK (o_.qualified == "sales.Orders");
  CHECK (o_.schema_ns == "sales");
  REQUIRE (o_.props.size () == 3);

  target::property const& uid (o_.props[1]);
  CHECK (uid.foreign);
  CHECK (uid.foreign_table == "dbo.Users");
  CHECK (uid.foreign_column == "Id");
  CHECK (!o_.props[0].foreign);

  target::property const& total (o_.props[2]);
  CHECK (total.unknown);
  CHECK (total.type == "unknown_type");
  CHECK (total.source_type == "DECIMAL(10,2)");

  target::entity const& v (m->ents[2]);
  CHECK (v.kind == target::entity::view);
  REQUIRE (v.props.size () == 2);
  CHECK (v.props[1].name == "Name");
  CHECK (v.props[1].unknown);
  CHECK (v.props[1].source_type.empty ());
}

TEST_CASE ("unmapped types are warnings", "[transformer]")
{
  options o (parse_options (rules ()));

  diagnostics d;
  unique_ptr<target::model> m (transform_sql (shop, o, d));

  REQUIRE (m.get () != 0);
  CHECK (!d.fatal ());
  CHECK (d.count (diagnostic::unmapped_type) == 3);

  diagnostic const* w (find_diagnostic (d, diagnostic::unmapped_type));
  REQUIRE (w != 0);
  CHECK (w->severity == diagnostic::warning);
  CHECK (w->loc.line == 8);
  CHECK (w->message ==
         "no type mapping for column 'Total' of 'sales.Orders' with type "
         "'DECIMAL(10,2)'");

  CHECK (d[d.size () - 1].message ==
         "no type mapping for column 'Name' of 'dbo.UserNames' without "
         "declared type");
}

TEST_CASE ("names are valid unique identifiers", "[transformer]")
{
  options o (parse_options ());

  diagnostics d;
  unique_ptr<target::model> m (
    transform_sql ("CREATE TABLE [Order Items] (\n"
                   "  [class] INT,\n"
                   "  [Unit Price] INT,\n"
                   "  [Unit-Price] INT,\n"
                   "  [2nd] INT,\n"
                   "  [Order Items] INT);\n",
                   o, d));

  REQUIRE (m.get () != 0);

  target::entity const& e (m->ents[0]);
  CHECK (e.class_name == "Order_Items");
  REQUIRE (e.props.size () == 5);
  CHECK (e.props[0].name == "class_");
  CHECK (e.props[0].column == "class");
  CHECK (e.props[1].name == "Unit_Price");
  CHECK (e.props[2].name == "Unit_Price1");
  CHECK (e.props[3].name == "cxx_2nd");
  CHECK (e.props[4].name == "Order_Items1");
}

TEST_CASE ("accessor and data member names are distinct", "[transformer]")
{
  options o (parse_options ());

  diagnostics d;
  unique_ptr<target::model> m (
    transform_sql ("CREATE TABLE T (X INT, X_ INT, Y_ INT, Y INT);\n"
                   "CREATE VIEW V (Price, Price_) AS SELECT 1, 2;\n",
                   o, d));

  REQUIRE (m.get () != 0);
  REQUIRE (m->ents.size () == 2);

  // The data member of X is X_.
  //
  target::properties const& t (m->ents[0].props);
  REQUIRE (t.size () == 4);
  CHECK (t[0].name == "X");
  CHECK (t[1].name == "X_1");
  CHECK (t[2].name == "Y_");
  CHECK (t[3].name == "Y1");

  target::properties const& v (m->ents[1].props);
  REQUIRE (v.size () == 2);
  CHECK (v[0].name == "Price");
  CHECK (v[1].name == "Price_1");
}

TEST_CASE ("column defaults and referential actions", "[transformer]")
{
  options o (parse_options ());

  diagnostics d;
  unique_ptr<target::model> m (
    transform_sql ("CREATE TABLE Users (Id INT NOT NULL PRIMARY KEY);\n"
                   "CREATE TABLE Orders (\n"
                   "  Id INT NOT NULL PRIMARY KEY,\n"
                   "  UserId INT NOT NULL,\n"
                   "  Placed DATETIME2 DEFAULT (\n"
                   "    GETDATE ()));\n"
                   "ALTER TABLE Orders ADD CONSTRAINT FK_Orders_Users\n"
                   "  FOREIGN KEY (UserId) REFERENCES Users (Id)\n"
                   "  ON DELETE CASCADE ON UPDATE SET NULL;\n",
                   o, d));

  REQUIRE (m.get () != 0);
  REQUIRE (m->ents.size () == 2);

  target::properties const& ps (m->ents[1].props);
  REQUIRE (ps.size () == 3);

  CHECK (ps[0].default_.empty ());
  CHECK (ps[1].foreign);
  CHECK (ps[1].foreign_actions == " ON DELETE CASCADE ON UPDATE SET NULL");
  CHECK (ps[2].default_ == "( GETDATE ())");
}

TEST_CASE ("unparseable types map to unknown", "[transformer]")
{
  options o (parse_options (rules ()));

  diagnostics d;
  unique_ptr<target::model> m (
    transform_sql ("CREATE TABLE Users (\n"
                   "  Id INT NOT NULL PRIMARY KEY,\n"
                   "  Code VARCHAR(10,2),\n"
                   "  Name NVARCHAR(50));\n",
                   o, d));

  REQUIRE (m.get () != 0);
  CHECK (!d.fatal ());

  // Reported once, by the ingestor.
  //
  CHECK (d.count (diagnostic::unmapped_type) == 1);

  target::properties const& ps (m->ents[0].props);
  REQUIRE (ps.size () == 3);
  CHECK (ps[1].unknown);
  CHECK (ps[1].type == "unknown_type");
  CHECK (ps[1].source_type == "VARCHAR(10,2)");
  CHECK (ps[2].type == "std::string");
}

TEST_CASE ("value sets", "[transformer]")
{
  char const sql[] =
    "CREATE TABLE ref.Status (\n"
    "  Code CHAR(1) NOT NULL PRIMARY KEY,\n"
    "  Label NVARCHAR(20) NULL,\n"
    "  Rank INT NOT NULL);\n"
    "INSERT INTO ref.Status VALUES\n"
    "  ('A', 'Active', 1),\n"
    "  ('I', NULL, 2),\n"
    "  ('value', 'Reserved', 3);\n";

  SECTION ("default columns")
  {
    vector<string> args (rules ());
    args.push_back ("--value-set");
    args.push_back ("ref.Status");
    options o (parse_options (args));

    diagnostics d;
    unique_ptr<target::model> m (transform_sql (sql, o, d));

    REQUIRE (m.get () != 0);
    REQUIRE (m->ents.size () == 1);

    target::entity const& e (m->ents[0]);
    CHECK (e.kind == target::entity::values);
    CHECK (e.props.empty ());

    target::value_set const& s (e.set);
    CHECK (s.value_column == "Code");
    CHECK (s.display_column == "Code");
    REQUIRE (s.attrs.size () == 2);
    CHECK (s.attrs[0].name == "Label");
    CHECK (s.attrs[1].name == "Rank");
    CHECK (s.attrs[1].type == "std::int32_t");

    REQUIRE (s.values.size () == 3);
    CHECK (s.values[0].value == "A");
    CHECK (s.values[0].display == "A");
    CHECK (s.values[0].name == "A");
    REQUIRE (s.values[0].attributes.size () == 2);
    CHECK (s.values[0].attributes[0].value == "Active");
    CHECK (s.values[1].attributes[0].null ());
    CHECK (s.values[2].name == "value1");
  }

  SECTION ("explicit columns")
  {
    vector<string> args (rules ());
    args.push_back ("--value-set");
    args.push_back ("[ref].[status]=Code,Label");
    options o (parse_options (args));

    diagnostics d;
    unique_ptr<target::model> m (transform_sql (sql, o, d));

    REQUIRE (m.get () != 0);

    target::value_set const& s (m->ents[0].set);
    CHECK (s.display_column == "Label");
    REQUIRE (s.attrs.size () == 1);
    CHECK (s.attrs[0].name == "Rank");

    CHECK (s.values[0].display == "Active");
    CHECK (s.values[1].display == "I"); // NULL label.
    CHECK (s.values[2].display == "Reserved");
  }

  SECTION ("unknown column")
  {
    vector<string> args;
    args.push_back ("--value-set");
    args.push_back ("ref.Status=Code,Missing");
    options o (parse_options (args));

    diagnostics d;
    unique_ptr<target::model> m (transform_sql (sql, o, d));

    CHECK (m.get () == 0);
    diagnostic const* e (find_diagnostic (d, diagnostic::reference_error));
    REQUIRE (e != 0);
    CHECK (contains (e->message, "column 'Missing'"));
  }
}

TEST_CASE ("value set errors", "[transformer]")
{
  SECTION ("unknown table")
  {
    vector<string> args;
    args.push_back ("--value-set");
    args.push_back ("Nowhere");
    options o (parse_options (args));

    diagnostics d;
    unique_ptr<target::model> m (
      transform_sql ("CREATE TABLE T (Id INT);", o, d));

    CHECK (m.get () == 0);
    diagnostic const* e (find_diagnostic (d, diagnostic::reference_error));
    REQUIRE (e != 0);
    CHECK (e->message == "value set table 'dbo.Nowhere' does not exist");
  }

  SECTION ("specified twice")
  {
    vector<string> args;
    args.push_back ("--value-set");
    args.push_back ("T");
    args.push_back ("--value-set");
    args.push_back ("dbo.t");
    options o (parse_options (args));

    diagnostics d;
    unique_ptr<target::model> m (
      transform_sql ("CREATE TABLE T (Id INT);\n"
                     "INSERT INTO T VALUES (1);\n",
                     o, d));

    CHECK (m.get () == 0);
    CHECK (find_diagnostic (d, diagnostic::duplicate_definition) != 0);
  }

  SECTION ("no rows")
  {
    vector<string> args;
    args.push_back ("--value-set");
    args.push_back ("T");
    options o (parse_options (args));

    diagnostics d;
    unique_ptr<target::model> m (
      transform_sql ("CREATE TABLE T (Id INT);", o, d));

    CHECK (m.get () == 0);
    diagnostic const* e (find_diagnostic (d, diagnostic::constraint_error));
    REQUIRE (e != 0);
    CHECK (contains (e->message, "has no rows"));
  }

  SECTION ("NULL and duplicate values")
  {
    vector<string> args;
    args.push_back ("--value-set");
    args.push_back ("T");
    options o (parse_options (args));

    diagnostics d;
    unique_ptr<target::model> m (
      transform_sql ("CREATE TABLE T (Id INT, Name NVARCHAR(10));\n"
                     "INSERT INTO T VALUES (1, 'a');\n"
                     "INSERT INTO T VALUES (NULL, 'b');\n"
                     "INSERT INTO T VALUES (1, 'c');\n",
                     o, d));

    CHECK (m.get () == 0);

    diagnostic const* n (find_diagnostic (d, diagnostic::constraint_error));
    REQUIRE (n != 0);
    CHECK (n->loc.line == 3);
    CHECK (contains (n->message, "NULL value in column 'Id'"));

    diagnostic const* u (
      find_diagnostic (d, diagnostic::duplicate_definition));
    REQUIRE (u != 0);
    CHECK (u->severity == diagnostic::error);
    CHECK (u->loc.line == 4);
    CHECK (contains (u->message, "duplicate value '1'"));

    CHECK (d[d.size () - 1].severity == diagnostic::info);
    CHECK (d[d.size () - 1].loc.line == 2);
  }
}
