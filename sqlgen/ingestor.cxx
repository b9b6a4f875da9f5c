// file      : sqlgen/ingestor.cxx
// license   : GNU GPL v3; see accompanying LICENSE file

#include <cctype> // std::toupper

#include <sqlgen/ingestor.hxx>
#include <sqlgen/parallel.hxx>
#include <sqlgen/sql-lexer.hxx>

using namespace std;

namespace
{
  string
  upcase (string const& s)
  {
    string r (s);

    for (string::size_type i (0); i != r.size (); ++i)
      r[i] = static_cast<char> (toupper (static_cast<unsigned char> (r[i])));

    return r;
  }

  string
  trim (string const& s)
  {
    string::size_type b (s.find_first_not_of (" \t\r\n"));

    if (b == string::npos)
      return string ();

    string::size_type e (s.find_last_not_of (" \t\r\n"));
    return string (s, b, e - b + 1);
  }

  // T-SQL statement parser. Every statement is parsed into the raw
  // model. Errors are recorded as diagnostics after which parsing
  // resumes at the next statement boundary.
  //
  class schema_parser
  {
  public:
    schema_parser (source const& s, raw::model& m, diagnostics& d)
        : src_ (s), m_ (m), diag_ (d), l_ (s.text), depth_ (0)
    {
    }

    void
    parse ();

  private:
    struct failed {};

    // Statements.
    //
    void
    statement (sql_token const&);

    void
    create ();

    void
    create_table ();

    void
    create_index (bool unique, bool clustered, sql_token const& start);

    void
    create_view (sql_token const& start);

    void
    alter ();

    void
    insert (sql_token const& start);

    // Table elements.
    //
    void
    column_def (raw::table&, sql_token const& name);

    bool
    constraint (raw::key&, sql_token const& kw, bool in_alter);

    void
    references (raw::key&);

    raw::action_type
    action ();

    bool
    clustering (bool def);

    void
    key_columns (vector<string>&);

    void
    index_options ();

    literal
    value ();

    // Names.
    //
    raw::qname
    qualified_name ();

    string
    identifier (char const* what);

    // Skipping.
    //
    string
    expression ();

    void
    skip_parens ();

    void
    skip_statement ();

    void
    skip_batch ();

    void
    recover ();

    // Tokens.
    //
    sql_token
    next ();

    sql_token
    peek ()
    {
      return l_.peek ();
    }

    // True if the token is the unquoted keyword kw (in upper case).
    //
    static bool
    keyword (sql_token const& t, char const* kw)
    {
      return t.type () == sql_token::t_identifier &&
        !t.quoted () &&
        upcase (t.identifier ()) == kw;
    }

    bool
    peek_keyword (char const* kw)
    {
      return keyword (peek (), kw);
    }

    void
    expect_keyword (char const* kw);

    void
    expect (sql_token::punctuation_type, char const* what);

    static bool
    statement_start (sql_token const&);

    location
    loc (sql_token const& t) const
    {
      return location (src_.name, t.line (), t.column ());
    }

    ostream&
    error (sql_token const& t)
    {
      return ::error (diag_, diagnostic::parse_error, loc (t));
    }

  private:
    source const& src_;
    raw::model& m_;
    diagnostics& diag_;

    sql_lexer l_;
    size_t depth_; // Parenthesis nesting level within the statement.
  };

  void schema_parser::
  parse ()
  {
    m_.source = src_.name;

    for (;;)
    {
      try
      {
        depth_ = 0;
        sql_token t (next ());

        if (t.type () == sql_token::t_eos)
          break;

        if (t.punctuation () == sql_token::p_semi || keyword (t, "GO"))
          continue;

        statement (t);
      }
      catch (failed const&)
      {
        recover ();
      }
      catch (sql_lexer::invalid_input const& e)
      {
        ::error (diag_,
                 diagnostic::parse_error,
                 location (src_.name, e.line, e.column)) << e.message << endl;
        recover ();
      }
    }
  }

  void schema_parser::
  statement (sql_token const& t)
  {
    if (keyword (t, "CREATE"))
      create ();
    else if (keyword (t, "ALTER"))
      alter ();
    else if (keyword (t, "INSERT"))
      insert (t);
    else if (t.type () == sql_token::t_identifier)
      skip_statement (); // SET, USE, PRINT, EXEC, DROP, etc.
    else
    {
      error (t) << "expected statement instead of '" << t << "'" << endl;
      throw failed ();
    }
  }

  void schema_parser::
  create ()
  {
    sql_token t (next ());

    // CREATE OR ALTER is treated as CREATE.
    //
    if (keyword (t, "OR"))
    {
      expect_keyword ("ALTER");
      t = next ();
    }

    if (keyword (t, "TABLE"))
    {
      create_table ();
      return;
    }

    if (keyword (t, "VIEW"))
    {
      create_view (t);
      return;
    }

    if (keyword (t, "PROCEDURE") ||
        keyword (t, "PROC") ||
        keyword (t, "FUNCTION") ||
        keyword (t, "TRIGGER"))
    {
      skip_batch ();
      return;
    }

    // CREATE [UNIQUE] [CLUSTERED | NONCLUSTERED] INDEX
    //
    sql_token start (t);
    bool unique (false), clustered (false);

    if (keyword (t, "UNIQUE"))
    {
      unique = true;
      t = next ();
    }

    if (keyword (t, "CLUSTERED"))
    {
      clustered = true;
      t = next ();
    }
    else if (keyword (t, "NONCLUSTERED"))
      t = next ();

    if (keyword (t, "INDEX"))
    {
      create_index (unique, clustered, start);
      return;
    }

    // Columnstore, XML, spatial, and full-text indexes as well as any
    // other object (SCHEMA, TYPE, SEQUENCE, etc).
    //
    skip_statement ();
  }

  void schema_parser::
  create_table ()
  {
    sql_token nt (peek ());

    raw::table t;
    t.name = qualified_name ();
    t.loc = loc (nt);

    expect (sql_token::p_lparen, "'(' after table name");

    for (bool first (true);; first = false)
    {
      sql_token e (next ());

      if (e.punctuation () == sql_token::p_rparen)
      {
        if (first)
        {
          error (e) << "table '" << t.name << "' has no columns" << endl;
          throw failed ();
        }

        break;
      }

      if (e.type () != sql_token::t_identifier)
      {
        error (e) << "expected column or constraint definition instead of '"
                  << e << "'" << endl;
        throw failed ();
      }

      if (keyword (e, "CONSTRAINT"))
      {
        raw::key k;
        k.loc = loc (e);
        k.name = identifier ("constraint name");

        if (constraint (k, next (), false))
          t.keys.push_back (k);
      }
      else if (keyword (e, "PRIMARY") ||
               keyword (e, "UNIQUE") ||
               keyword (e, "FOREIGN") ||
               keyword (e, "CHECK") ||
               keyword (e, "INDEX"))
      {
        raw::key k;
        k.loc = loc (e);

        if (constraint (k, e, false))
          t.keys.push_back (k);
      }
      else if (keyword (e, "PERIOD"))
      {
        // PERIOD FOR SYSTEM_TIME (start, end)
        //
        expect_keyword ("FOR");
        identifier ("period name");
        skip_parens ();
      }
      else
        column_def (t, e);

      sql_token d (next ());

      if (d.punctuation () == sql_token::p_rparen)
        break;

      if (d.punctuation () != sql_token::p_comma)
      {
        error (d) << "expected ',' or ')' instead of '" << d << "'" << endl;
        throw failed ();
      }

      // Allow the trailing comma.
      //
      if (peek ().punctuation () == sql_token::p_rparen)
      {
        next ();
        break;
      }
    }

    if (t.columns.empty ())
    {
      error (nt) << "table '" << t.name << "' has no columns" << endl;
      throw failed ();
    }

    // Storage options.
    //
    for (;;)
    {
      if (peek_keyword ("ON") ||
          peek_keyword ("TEXTIMAGE_ON") ||
          peek_keyword ("FILESTREAM_ON"))
      {
        next ();
        identifier ("filegroup or partition scheme");

        if (peek ().punctuation () == sql_token::p_lparen)
          skip_parens ();
      }
      else if (peek_keyword ("WITH"))
      {
        next ();
        skip_parens ();
      }
      else
        break;
    }

    m_.tables.push_back (t);
  }

  void schema_parser::
  column_def (raw::table& t, sql_token const& name)
  {
    raw::column c;
    c.name = name.identifier ();
    c.loc = loc (name);

    // Computed column.
    //
    if (peek_keyword ("AS"))
    {
      next ();
      expression ();
      c.computed = true;

      if (peek_keyword ("PERSISTED"))
      {
        next ();

        if (peek_keyword ("NOT"))
        {
          next ();
          expect_keyword ("NULL");
          c.null = false;
        }
      }

      t.columns.push_back (c);
      return;
    }

    // Type. Everything up to the end of the optional parameter list is
    // handed over to the type parser.
    //
    {
      sql_token tt (next ());

      if (tt.type () != sql_token::t_identifier)
      {
        error (tt) << "expected type name for column '" << c.name
                   << "' instead of '" << tt << "'" << endl;
        throw failed ();
      }

      size_t b (tt.offset ()), e (l_.offset ());

      while (peek ().punctuation () == sql_token::p_dot)
      {
        next ();
        identifier ("type name");
        e = l_.offset ();
      }

      string id (upcase (tt.identifier ()));

      if (!tt.quoted ())
      {
        // Multi-word type names.
        //
        if (id == "DOUBLE" && peek_keyword ("PRECISION"))
        {
          next ();
          e = l_.offset ();
        }
        else if (id == "NATIONAL" &&
                 (peek_keyword ("CHAR") ||
                  peek_keyword ("CHARACTER") ||
                  peek_keyword ("TEXT")))
        {
          id = upcase (next ().identifier ());
          e = l_.offset ();
        }

        if ((id == "CHAR" || id == "CHARACTER" || id == "BINARY") &&
            peek_keyword ("VARYING"))
        {
          next ();
          e = l_.offset ();
        }
      }

      if (peek ().punctuation () == sql_token::p_lparen)
      {
        skip_parens ();
        e = l_.offset ();
      }

      c.type_decl = string (src_.text, b, e - b);

      try
      {
        c.type = sql_type::parse (c.type_decl);
      }
      catch (invalid_sql_type const& ex)
      {
        // Keep the column. Its type stays invalid and is mapped to the
        // unknown type.
        //
        ::warn (diag_, diagnostic::unmapped_type, loc (tt))
          << "unparseable type '" << c.type_decl << "' of column '"
          << c.name << "': " << ex.message () << endl;
      }
    }

    // Column attributes.
    //
    string cname; // Pending CONSTRAINT name.
    location cloc;

    for (;;)
    {
      sql_token a (peek ());

      if (a.punctuation () == sql_token::p_comma ||
          a.punctuation () == sql_token::p_rparen)
        break;

      a = next ();

      if (keyword (a, "NULL"))
        c.null = true;
      else if (keyword (a, "NOT"))
      {
        if (peek_keyword ("FOR"))
        {
          next ();
          expect_keyword ("REPLICATION");
        }
        else
        {
          expect_keyword ("NULL");
          c.null = false;
        }
      }
      else if (keyword (a, "IDENTITY"))
      {
        c.identity = true;

        if (peek ().punctuation () == sql_token::p_lparen)
          skip_parens ();
      }
      else if (keyword (a, "CONSTRAINT"))
      {
        cname = identifier ("constraint name");
        cloc = loc (a);
        continue;
      }
      else if (keyword (a, "PRIMARY"))
      {
        expect_keyword ("KEY");
        c.primary = true;
        c.clustered = clustering (true);
        c.primary_name = cname;
        index_options ();
      }
      else if (keyword (a, "UNIQUE"))
      {
        raw::key k;
        k.kind = raw::key::unique;
        k.name = cname;
        k.loc = cname.empty () ? loc (a) : cloc;
        k.clustered = clustering (false);
        k.columns.push_back (c.name);
        index_options ();
        t.keys.push_back (k);
      }
      else if (keyword (a, "FOREIGN") || keyword (a, "REFERENCES"))
      {
        if (keyword (a, "FOREIGN"))
        {
          expect_keyword ("KEY");
          expect_keyword ("REFERENCES");
        }

        raw::key k;
        k.kind = raw::key::foreign;
        k.name = cname;
        k.loc = cname.empty () ? loc (a) : cloc;
        k.columns.push_back (c.name);
        references (k);
        t.keys.push_back (k);
      }
      else if (keyword (a, "INDEX"))
      {
        raw::key k;
        k.kind = raw::key::index;
        k.loc = loc (a);
        k.name = identifier ("index name");

        if (peek_keyword ("UNIQUE"))
        {
          next ();
          k.kind = raw::key::unique;
        }

        k.clustered = clustering (false);
        k.columns.push_back (c.name);
        index_options ();
        t.keys.push_back (k);
      }
      else if (keyword (a, "DEFAULT"))
      {
        c.default_ = expression ();
      }
      else if (keyword (a, "CHECK"))
      {
        if (peek_keyword ("NOT"))
        {
          next ();
          expect_keyword ("FOR");
          expect_keyword ("REPLICATION");
        }

        skip_parens ();
      }
      else if (keyword (a, "COLLATE"))
        identifier ("collation name");
      else if (keyword (a, "ROWGUIDCOL") ||
               keyword (a, "SPARSE") ||
               keyword (a, "FILESTREAM") ||
               keyword (a, "HIDDEN"))
        ;
      else if (keyword (a, "GENERATED"))
      {
        // GENERATED ALWAYS AS ROW START | END
        //
        expect_keyword ("ALWAYS");
        expect_keyword ("AS");
        expect_keyword ("ROW");
        identifier ("START or END");
      }
      else if (keyword (a, "MASKED"))
      {
        expect_keyword ("WITH");
        skip_parens ();
      }
      else
      {
        error (a) << "unexpected '" << a << "' in definition of column '"
                  << c.name << "'" << endl;
        throw failed ();
      }

      cname.clear ();
    }

    t.columns.push_back (c);
  }


  bool schema_parser::
  constraint (raw::key& k, sql_token const& kw, bool in_alter)
  {
    if (keyword (kw, "PRIMARY"))
    {
      expect_keyword ("KEY");
      k.kind = raw::key::primary;
      k.clustered = clustering (true);
      key_columns (k.columns);
      index_options ();
      return true;
    }

    if (keyword (kw, "UNIQUE"))
    {
      k.kind = raw::key::unique;
      k.clustered = clustering (false);
      key_columns (k.columns);
      index_options ();
      return true;
    }

    if (keyword (kw, "FOREIGN"))
    {
      expect_keyword ("KEY");
      k.kind = raw::key::foreign;
      key_columns (k.columns);
      expect_keyword ("REFERENCES");
      references (k);
      return true;
    }

    if (keyword (kw, "CHECK"))
    {
      if (peek_keyword ("NOT"))
      {
        next ();
        expect_keyword ("FOR");
        expect_keyword ("REPLICATION");
      }

      skip_parens ();
      return false;
    }

    if (keyword (kw, "INDEX") && !in_alter)
    {
      k.kind = raw::key::index;
      k.name = identifier ("index name");

      if (peek_keyword ("UNIQUE"))
      {
        next ();
        k.kind = raw::key::unique;
      }

      k.clustered = clustering (false);
      key_columns (k.columns);

      if (peek_keyword ("INCLUDE"))
      {
        next ();
        skip_parens ();
      }

      index_options ();
      return true;
    }

    if (keyword (kw, "DEFAULT") && in_alter)
    {
      // DEFAULT expr FOR column [WITH VALUES]
      //
      expression ();
      expect_keyword ("FOR");
      identifier ("column name");

      if (peek_keyword ("WITH"))
      {
        next ();
        expect_keyword ("VALUES");
      }

      return false;
    }

    error (kw) << "expected constraint definition instead of '" << kw << "'"
               << endl;
    throw failed ();
  }

  void schema_parser::
  references (raw::key& k)
  {
    k.referenced_table = qualified_name ();

    if (peek ().punctuation () == sql_token::p_lparen)
      key_columns (k.referenced_columns);

    for (;;)
    {
      if (peek_keyword ("ON"))
      {
        next ();
        sql_token t (next ());

        if (keyword (t, "DELETE"))
          k.on_delete = action ();
        else if (keyword (t, "UPDATE"))
          k.on_update = action ();
        else
        {
          error (t) << "expected 'DELETE' or 'UPDATE' instead of '" << t
                    << "'" << endl;
          throw failed ();
        }
      }
      else if (peek_keyword ("NOT"))
      {
        next ();
        expect_keyword ("FOR");
        expect_keyword ("REPLICATION");
      }
      else
        break;
    }
  }

  raw::action_type schema_parser::
  action ()
  {
    sql_token t (next ());

    if (keyword (t, "NO"))
    {
      expect_keyword ("ACTION");
      return raw::no_action;
    }

    if (keyword (t, "CASCADE"))
      return raw::cascade;

    if (keyword (t, "SET"))
    {
      t = next ();

      if (keyword (t, "NULL"))
        return raw::set_null;

      if (keyword (t, "DEFAULT"))
        return raw::set_default;
    }

    error (t) << "expected referential action instead of '" << t << "'"
              << endl;
    throw failed ();
  }

  bool schema_parser::
  clustering (bool def)
  {
    if (peek_keyword ("CLUSTERED"))
    {
      next ();
      return true;
    }

    if (peek_keyword ("NONCLUSTERED"))
    {
      next ();
      return false;
    }

    return def;
  }

  void schema_parser::
  key_columns (vector<string>& r)
  {
    expect (sql_token::p_lparen, "'(' before column list");

    for (;;)
    {
      r.push_back (identifier ("column name"));

      if (peek_keyword ("ASC") || peek_keyword ("DESC"))
        next ();

      sql_token t (next ());

      if (t.punctuation () == sql_token::p_rparen)
        break;

      if (t.punctuation () != sql_token::p_comma)
      {
        error (t) << "expected ',' or ')' in column list instead of '" << t
                  << "'" << endl;
        throw failed ();
      }
    }
  }

  void schema_parser::
  index_options ()
  {
    for (;;)
    {
      if (peek_keyword ("WITH"))
      {
        next ();

        if (peek ().punctuation () == sql_token::p_lparen)
          skip_parens ();
        else
        {
          // Old-style WITH FILLFACTOR = n.
          //
          identifier ("index option");
          expect (sql_token::p_eq, "'=' after index option");
          next ();
        }
      }
      else if (peek_keyword ("ON"))
      {
        next ();
        identifier ("filegroup or partition scheme");

        if (peek ().punctuation () == sql_token::p_lparen)
          skip_parens ();
      }
      else
        break;
    }
  }

  void schema_parser::
  create_index (bool unique, bool clustered, sql_token const& start)
  {
    raw::table_key tk;
    raw::key& k (tk.k);

    k.kind = unique ? raw::key::unique : raw::key::index;
    k.clustered = clustered;
    k.loc = loc (start);
    k.name = identifier ("index name");

    expect_keyword ("ON");
    tk.table = qualified_name ();
    key_columns (k.columns);

    for (;;)
    {
      if (peek_keyword ("INCLUDE"))
      {
        next ();
        skip_parens ();
      }
      else if (peek_keyword ("WHERE"))
      {
        // Filtered index.
        //
        next ();

        for (sql_token t (peek ());
             t.type () != sql_token::t_eos &&
               !(depth_ == 0 &&
                 (t.punctuation () == sql_token::p_semi ||
                  keyword (t, "WITH") ||
                  keyword (t, "ON") ||
                  statement_start (t)));
             t = peek ())
          next ();
      }
      else if (peek_keyword ("WITH") || peek_keyword ("ON"))
        index_options ();
      else
        break;
    }

    m_.keys.push_back (tk);
  }

  void schema_parser::
  create_view (sql_token const& start)
  {
    raw::view v;
    v.loc = loc (peek ());
    v.name = qualified_name ();

    if (peek ().punctuation () == sql_token::p_lparen)
    {
      next ();

      for (;;)
      {
        v.columns.push_back (identifier ("column name"));

        sql_token t (next ());

        if (t.punctuation () == sql_token::p_rparen)
          break;

        if (t.punctuation () != sql_token::p_comma)
        {
          error (t) << "expected ',' or ')' in view column list instead of '"
                    << t << "'" << endl;
          throw failed ();
        }
      }
    }

    if (peek_keyword ("WITH"))
    {
      // SCHEMABINDING, ENCRYPTION, VIEW_METADATA.
      //
      next ();

      for (identifier ("view attribute");
           peek ().punctuation () == sql_token::p_comma;
           identifier ("view attribute"))
        next ();
    }

    expect_keyword ("AS");

    sql_token t (peek ());

    if (t.type () == sql_token::t_eos ||
        t.punctuation () == sql_token::p_semi)
    {
      error (start) << "view '" << v.name << "' has no query" << endl;
      throw failed ();
    }

    size_t b (t.offset ()), e (b);

    for (;
         t.type () != sql_token::t_eos &&
           !(depth_ == 0 &&
             (t.punctuation () == sql_token::p_semi || statement_start (t)));
         t = peek ())
    {
      next ();
      e = l_.offset ();
    }

    v.query = trim (string (src_.text, b, e - b));
    m_.views.push_back (v);
  }

  void schema_parser::
  alter ()
  {
    sql_token t (next ());

    if (!keyword (t, "TABLE"))
    {
      if (keyword (t, "PROCEDURE") ||
          keyword (t, "PROC") ||
          keyword (t, "FUNCTION") ||
          keyword (t, "TRIGGER"))
        skip_batch ();
      else
        skip_statement ();

      return;
    }

    raw::qname table (qualified_name ());

    if (peek_keyword ("WITH"))
    {
      next ();
      t = next ();

      if (!keyword (t, "CHECK") && !keyword (t, "NOCHECK"))
      {
        error (t) << "expected 'CHECK' or 'NOCHECK' instead of '" << t << "'"
                  << endl;
        throw failed ();
      }
    }

    if (!peek_keyword ("ADD"))
    {
      // ALTER COLUMN, DROP, CHECK CONSTRAINT, etc.
      //
      skip_statement ();
      return;
    }

    next ();

    for (;;)
    {
      raw::table_key tk;
      tk.table = table;
      tk.k.loc = loc (peek ());

      sql_token kw (peek ());

      if (keyword (kw, "CONSTRAINT"))
      {
        next ();
        tk.k.name = identifier ("constraint name");
        kw = peek ();
      }

      if (keyword (kw, "PRIMARY") ||
          keyword (kw, "UNIQUE") ||
          keyword (kw, "FOREIGN") ||
          keyword (kw, "CHECK") ||
          keyword (kw, "DEFAULT"))
      {
        next ();

        if (constraint (tk.k, kw, true))
          m_.keys.push_back (tk);
      }
      else
      {
        // ADD column is not tracked.
        //
        skip_statement ();
        return;
      }

      if (peek ().punctuation () != sql_token::p_comma)
        break;

      next ();
    }
  }

  void schema_parser::
  insert (sql_token const& start)
  {
    raw::insert in;
    in.loc = loc (start);

    if (peek_keyword ("INTO"))
      next ();

    in.table = qualified_name ();

    if (peek ().punctuation () == sql_token::p_lparen)
    {
      next ();

      for (;;)
      {
        in.columns.push_back (identifier ("column name"));

        sql_token t (next ());

        if (t.punctuation () == sql_token::p_rparen)
          break;

        if (t.punctuation () != sql_token::p_comma)
        {
          error (t) << "expected ',' or ')' in column list instead of '"
                    << t << "'" << endl;
          throw failed ();
        }
      }
    }

    if (!peek_keyword ("VALUES"))
    {
      // INSERT ... SELECT, EXEC, DEFAULT VALUES.
      //
      skip_statement ();
      return;
    }

    next ();

    for (;;)
    {
      sql_token rs (peek ());
      expect (sql_token::p_lparen, "'(' before row values");

      vector<literal> row;

      for (;;)
      {
        row.push_back (value ());

        sql_token t (next ());

        if (t.punctuation () == sql_token::p_rparen)
          break;

        if (t.punctuation () != sql_token::p_comma)
        {
          error (t) << "expected ',' or ')' in row values instead of '"
                    << t << "'" << endl;
          throw failed ();
        }
      }

      if (!in.columns.empty () && row.size () != in.columns.size ())
      {
        error (rs) << "row has " << row.size () << " values while "
                   << in.columns.size () << " columns are specified" << endl;
        throw failed ();
      }

      in.rows.push_back (row);

      if (peek ().punctuation () != sql_token::p_comma)
        break;

      next ();
    }

    m_.inserts.push_back (in);
  }

  literal schema_parser::
  value ()
  {
    sql_token t (next ());
    location l (loc (t));

    switch (t.type ())
    {
    case sql_token::t_string_lit:
      {
        literal r (literal::string_lit, t.literal (), l);
        r.national = t.national ();
        return r;
      }
    case sql_token::t_int_lit:
    case sql_token::t_float_lit:
      return literal (literal::number_lit, t.literal (), l);
    case sql_token::t_punctuation:
      {
        if (t.punctuation () == sql_token::p_other &&
            (t.literal () == "-" || t.literal () == "+"))
        {
          sql_token n (next ());

          if (n.type () == sql_token::t_int_lit ||
              n.type () == sql_token::t_float_lit)
          {
            string v (t.literal () == "-" ? "-" : "");
            return literal (literal::number_lit, v + n.literal (), l);
          }

          t = n;
        }

        break;
      }
    case sql_token::t_identifier:
      {
        if (t.quoted ())
          break;

        if (keyword (t, "NULL"))
          return literal (literal::null_lit, string (), l);

        // Bare word or a function call such as GETDATE().
        //
        size_t e (l_.offset ());

        if (peek ().punctuation () == sql_token::p_lparen)
        {
          skip_parens ();
          e = l_.offset ();
        }

        return literal (literal::keyword_lit,
                        string (src_.text, t.offset (), e - t.offset ()),
                        l);
      }
    case sql_token::t_eos:
      break;
    }

    error (t) << "expected literal value instead of '" << t << "'" << endl;
    throw failed ();
  }

  raw::qname schema_parser::
  qualified_name ()
  {
    vector<string> parts;
    parts.push_back (identifier ("name"));

    while (peek ().punctuation () == sql_token::p_dot)
    {
      next ();

      // Empty part as in db..table.
      //
      if (peek ().punctuation () == sql_token::p_dot)
        parts.push_back (string ());
      else
        parts.push_back (identifier ("name"));
    }

    if (parts.size () > 4)
    {
      error (peek ()) << "too many parts in name '" << parts.back () << "'"
                      << endl;
      throw failed ();
    }

    // Only keep the schema and the object name.
    //
    raw::qname r;
    string s (parts.size () > 1 ? parts[parts.size () - 2] : string ());

    if (!s.empty ())
      r.append (s);

    r.append (parts.back ());
    return r;
  }

  string schema_parser::
  identifier (char const* what)
  {
    sql_token t (next ());

    if (t.type () != sql_token::t_identifier)
    {
      error (t) << "expected " << what << " instead of '" << t << "'" << endl;
      throw failed ();
    }

    return t.identifier ();
  }

  // Default value or computed column expression. Returns the source
  // text of the expression.
  //
  string schema_parser::
  expression ()
  {
    size_t d (depth_);
    sql_token t (peek ());

    if (t.type () == sql_token::t_eos ||
        (d == depth_ && (t.punctuation () == sql_token::p_comma ||
                         t.punctuation () == sql_token::p_rparen ||
                         t.punctuation () == sql_token::p_semi)))
    {
      error (t) << "expected expression instead of '" << t << "'" << endl;
      throw failed ();
    }

    size_t b (t.offset ()), e (b);
    sql_token prev;

    for (bool first (true);; first = false)
    {
      t = peek ();

      if (t.type () == sql_token::t_eos)
        break;

      if (depth_ == d && !first)
      {
        if (t.punctuation () == sql_token::p_comma ||
            t.punctuation () == sql_token::p_rparen ||
            t.punctuation () == sql_token::p_semi)
          break;

        bool after_is (keyword (prev, "IS") || keyword (prev, "NOT"));

        if ((keyword (t, "NOT") && !keyword (prev, "IS")) ||
            (keyword (t, "NULL") && !after_is) ||
            keyword (t, "CONSTRAINT") ||
            keyword (t, "PRIMARY") ||
            keyword (t, "UNIQUE") ||
            keyword (t, "REFERENCES") ||
            keyword (t, "FOREIGN") ||
            keyword (t, "CHECK") ||
            keyword (t, "COLLATE") ||
            keyword (t, "IDENTITY") ||
            keyword (t, "ROWGUIDCOL") ||
            keyword (t, "SPARSE") ||
            keyword (t, "DEFAULT") ||
            keyword (t, "PERSISTED") ||
            keyword (t, "INDEX") ||
            keyword (t, "WITH") ||
            keyword (t, "FOR"))
          break;
      }

      // Unbalanced ')' ends the enclosing list.
      //
      if (depth_ == d && t.punctuation () == sql_token::p_rparen)
        break;

      prev = next ();
      e = l_.offset ();
    }

    return trim (string (src_.text, b, e - b));
  }

  void schema_parser::
  skip_parens ()
  {
    size_t d (depth_);
    expect (sql_token::p_lparen, "'('");

    while (depth_ != d)
    {
      sql_token t (next ());

      if (t.type () == sql_token::t_eos)
      {
        error (t) << "expected ')' instead of end of input" << endl;
        throw failed ();
      }
    }
  }

  void schema_parser::
  skip_statement ()
  {
    for (sql_token t (peek ());
         t.type () != sql_token::t_eos;
         t = peek ())
    {
      if (depth_ == 0 && statement_start (t))
        break;

      next ();

      if (depth_ == 0 && t.punctuation () == sql_token::p_semi)
        break;
    }
  }

  // Procedure, function, and trigger bodies extend to the end of the
  // batch.
  //
  void schema_parser::
  skip_batch ()
  {
    for (sql_token t (peek ());
         t.type () != sql_token::t_eos && !keyword (t, "GO");
         t = peek ())
      next ();
  }

  void schema_parser::
  recover ()
  {
    for (;;)
    {
      try
      {
        skip_statement ();
        return;
      }
      catch (sql_lexer::invalid_input const& e)
      {
        ::error (diag_,
                 diagnostic::parse_error,
                 location (src_.name, e.line, e.column)) << e.message << endl;
      }
    }
  }

  sql_token schema_parser::
  next ()
  {
    sql_token t (l_.next ());

    switch (t.punctuation ())
    {
    case sql_token::p_lparen:
      depth_++;
      break;
    case sql_token::p_rparen:
      {
        if (depth_ != 0)
          depth_--;
        break;
      }
    default:
      break;
    }

    return t;
  }

  void schema_parser::
  expect_keyword (char const* kw)
  {
    sql_token t (next ());

    if (!keyword (t, kw))
    {
      error (t) << "expected '" << kw << "' instead of '" << t << "'"
                << endl;
      throw failed ();
    }
  }

  void schema_parser::
  expect (sql_token::punctuation_type p, char const* what)
  {
    sql_token t (next ());

    if (t.punctuation () != p)
    {
      error (t) << "expected " << what << " instead of '" << t << "'"
                << endl;
      throw failed ();
    }
  }

  bool schema_parser::
  statement_start (sql_token const& t)
  {
    return keyword (t, "GO") ||
      keyword (t, "CREATE") ||
      keyword (t, "ALTER") ||
      keyword (t, "INSERT") ||
      keyword (t, "DROP") ||
      keyword (t, "SET") ||
      keyword (t, "USE");
  }

  struct parse_source
  {
    parse_source (ingestor const& i,
                  sources const& s,
                  raw::models& m,
                  vector<diagnostics>& d)
        : i_ (i), s_ (s), m_ (m), d_ (d)
    {
    }

    void
    operator() (size_t n) const
    {
      m_[n] = i_.parse (s_[n], d_[n]);
    }

  private:
    ingestor const& i_;
    sources const& s_;
    raw::models& m_;
    vector<diagnostics>& d_;
  };
}

//
// ingestor
//

ingestor::
ingestor (options const& ops)
    : ops_ (ops)
{
}

raw::model ingestor::
parse (source const& s, diagnostics& d) const
{
  raw::model m;
  schema_parser p (s, m, d);
  p.parse ();
  return m;
}

raw::models ingestor::
ingest (sources const& ss, diagnostics& d) const
{
  raw::models r (ss.size ());
  vector<diagnostics> ds (ss.size ());

  run_parallel (ss.size (), ops_.jobs (), parse_source (*this, ss, r, ds));

  for (size_t i (0); i != ds.size (); ++i)
    d.append (ds[i]);

  return r;
}
