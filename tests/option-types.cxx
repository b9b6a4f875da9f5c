// file      : tests/option-types.cxx
// license   : GNU GPL v3; see accompanying LICENSE file

#include <string>
#include <sstream>

#include <catch2/catch.hpp>

#include <sqlgen/option-types.hxx>

#include "common.hxx"

using namespace std;

namespace
{
  bool
  parse (string const& s, type_map_rule& r)
  {
    istringstream is (s);
    return !(is >> r).fail ();
  }

  bool
  parse (string const& s, value_set_spec& v)
  {
    istringstream is (s);
    return !(is >> v).fail ();
  }
}

TEST_CASE ("type mapping rule short form", "[option-types]")
{
  type_map_rule r;
  REQUIRE (parse ("NVARCHAR = std::wstring", r));

  CHECK (r.type == "NVARCHAR");
  CHECK (r.as == "std::wstring");
  CHECK (!r.regex);
  CHECK (r.patterns () == 1);
  CHECK (r.string () == "type=NVARCHAR;as=std::wstring");
}

TEST_CASE ("type mapping rule long form", "[option-types]")
{
  type_map_rule r;
  REQUIRE (parse ("schema=sales; table=Orders;column=Total;type=DECIMAL;"
                  "as=money_type", r));

  CHECK (r.schema == "sales");
  CHECK (r.table == "Orders");
  CHECK (r.column == "Total");
  CHECK (r.type == "DECIMAL");
  CHECK (r.as == "money_type");
  CHECK (r.patterns () == 4);

  REQUIRE (parse ("regex:column=.*Id$;type=INT|BIGINT;as=id_type", r));
  CHECK (r.regex);
  CHECK (r.column == ".*Id$");
  CHECK (r.type == "INT|BIGINT");
  CHECK (r.patterns () == 2);
  CHECK (r.string () == "regex:column=.*Id$;type=INT|BIGINT;as=id_type");

  // A single key=value pair with a field name is the long form.
  //
  CHECK (!parse ("type=INT", r));
}

TEST_CASE ("malformed type mapping rules", "[option-types]")
{
  type_map_rule r;

  CHECK (!parse ("", r));
  CHECK (!parse ("INT", r));
  CHECK (!parse ("INT=", r));
  CHECK (!parse ("type=INT;as=int;type=BIGINT", r));
  CHECK (!parse ("type=INT;as=int;colour=red", r));
  CHECK (!parse ("table=Users;as=int", r));
  CHECK (!parse ("type=INT;as", r));
}

TEST_CASE ("value set specification", "[option-types]")
{
  value_set_spec v;

  REQUIRE (parse ("dbo.Status", v));
  CHECK (v.table == "dbo.Status");
  CHECK (v.value.empty ());
  CHECK (v.display.empty ());

  REQUIRE (parse ("Status=Code", v));
  CHECK (v.table == "Status");
  CHECK (v.value == "Code");
  CHECK (v.display.empty ());

  REQUIRE (parse ("Status = Code , Label", v));
  CHECK (v.table == "Status");
  CHECK (v.value == "Code");
  CHECK (v.display == "Label");

  ostringstream os;
  os << v;
  CHECK (os.str () == "Status=Code,Label");

  CHECK (!parse ("", v));
  CHECK (!parse ("=Code", v));
  CHECK (!parse ("Status=", v));
  CHECK (!parse ("Status=Code,", v));
}

TEST_CASE ("command line", "[option-types]")
{
  vector<string> args;
  args.push_back ("--type-map");
  args.push_back ("INT=int");
  args.push_back ("--type-map");
  args.push_back ("regex:type=N?VARCHAR;as=std::string");
  args.push_back ("--value-set");
  args.push_back ("Status=Code,Label");
  args.push_back ("--jobs");
  args.push_back ("4");

  options o (parse_options (args));

  REQUIRE (o.type_map ().size () == 2);
  CHECK (o.type_map ()[0].type == "INT");
  CHECK (o.type_map ()[1].regex);
  REQUIRE (o.value_set ().size () == 1);
  CHECK (o.value_set ()[0].display == "Label");
  CHECK (o.jobs () == 4);
  CHECK (o.default_schema () == "dbo");
  CHECK (o.unknown_type () == "unknown_type");

  args.clear ();
  args.push_back ("--type-map");
  args.push_back ("INT");
  CHECK_THROWS_AS (parse_options (args), cli::exception);
}
