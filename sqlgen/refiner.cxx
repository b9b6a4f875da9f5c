// file      : sqlgen/refiner.cxx
// license   : GNU GPL v3; see accompanying LICENSE file

#include <map>
#include <set>
#include <vector>
#include <sstream>

#include <sqlgen/refiner.hxx>

using namespace std;

namespace relational = semantics::relational;

using relational::qname;
using relational::ukey;

namespace
{
  struct table_info
  {
    table_info (relational::table& t_, raw::table const& r_)
        : t (t_), r (r_)
    {
    }

    relational::table& t;
    raw::table const& r;

    // Keys declared in CREATE TABLE followed by those added with ALTER
    // TABLE and CREATE INDEX, in the declaration order.
    //
    vector<raw::key const*> keys;
  };

  typedef vector<table_info> table_infos;

  class refine_impl
  {
  public:
    refine_impl (options const& ops, raw::models const& ms, diagnostics& d)
        : ops_ (ops), ms_ (ms), diag_ (d), m_ (new relational::model)
    {
    }

    unique_ptr<relational::model>
    refine ()
    {
      merge ();

      if (!diag_.fatal ())
        resolve ();

      normalize ();

      if (diag_.fatal ())
        m_.reset ();

      return move (m_);
    }

  private:
    void
    merge ();

    void
    resolve ();

    void
    normalize ();

    //
    //
    void
    foreign_key (table_info&, raw::key const&, size_t n);

    void
    primary_key (table_info&);

    void
    index (table_info&, raw::key const&, size_t n, set<string>& seen);

    void
    insert (raw::insert const&);

    // Add the key columns. Return false if any of them does not exist
    // in the table.
    //
    bool
    key_columns (relational::key&,
                 relational::table&,
                 vector<string> const& columns,
                 location const&);

    void
    duplicate (relational::duplicate_name const&,
               location const&,
               char const* what);

  private:
    qname
    qualify (qname const& n) const
    {
      return n.qualified () ? n : qname (ops_.default_schema (), n.uname ());
    }

    table_info*
    lookup (qname const& n)
    {
      table_map::const_iterator i (table_map_.find (qualify (n).key ()));
      return i != table_map_.end () ? &tables_[i->second] : 0;
    }

    // Primary key columns as declared, without validation.
    //
    static vector<string>
    declared_primary (table_info const&);

    static string
    key_name (raw::key const& k, char const* prefix, size_t n)
    {
      if (!k.name.empty ())
        return k.name;

      // The colon cannot appear in an unquoted identifier.
      //
      ostringstream os;
      os << prefix << ':' << n;
      return os.str ();
    }

  private:
    options const& ops_;
    raw::models const& ms_;
    diagnostics& diag_;

    unique_ptr<relational::model> m_;
    table_infos tables_;

    // Table name key to the tables_ index.
    //
    typedef map<string, size_t> table_map;
    table_map table_map_;
  };

  void refine_impl::
  duplicate (relational::duplicate_name const& e,
             location const& l,
             char const* what)
  {
    error (diag_, diagnostic::duplicate_definition, l)
      << what << " '" << e.name << "' is already defined" << endl;

    info (diag_, diagnostic::duplicate_definition, e.orig.loc ())
      << "previous definition of '" << e.name << "' is here" << endl;
  }

  //
  // Step 1: merge the tables and views into a single namespace.
  //

  void refine_impl::
  merge ()
  {
    using relational::names;
    using relational::column;

    relational::model& m (*m_);

    for (raw::models::const_iterator mi (ms_.begin ()); mi != ms_.end (); ++mi)
    {
      for (vector<raw::table>::const_iterator i (mi->tables.begin ());
           i != mi->tables.end ();
           ++i)
      {
        qname n (qualify (i->name));
        relational::table& t (m.new_node<relational::table> (i->loc, n));

        try
        {
          m.new_edge<names> (m, t, n.string ());
        }
        catch (relational::duplicate_name const& e)
        {
          duplicate (e, i->loc, "table");
          continue;
        }

        size_t ordinal (0);

        for (vector<raw::column>::const_iterator j (i->columns.begin ());
             j != i->columns.end ();
             ++j)
        {
          column& c (
            m.new_node<column> (j->loc, ordinal, j->type_decl, j->type));

          try
          {
            m.new_edge<names> (t, c, j->name);
          }
          catch (relational::duplicate_name const& e)
          {
            error (diag_, diagnostic::duplicate_definition, j->loc)
              << "column '" << e.name << "' is already defined in table '"
              << n << "'" << endl;
            continue;
          }

          c.null (j->null);
          c.identity (j->identity);
          c.default_ (j->default_);
          ordinal++;
        }

        table_map_[t.qualified_name ().key ()] = tables_.size ();
        tables_.push_back (table_info (t, *i));
        table_info& ti (tables_.back ());

        for (vector<raw::key>::const_iterator j (i->keys.begin ());
             j != i->keys.end ();
             ++j)
          ti.keys.push_back (&*j);
      }

      for (vector<raw::view>::const_iterator i (mi->views.begin ());
           i != mi->views.end ();
           ++i)
      {
        qname n (qualify (i->name));
        relational::view& v (
          m.new_node<relational::view> (i->loc, n, i->query));

        try
        {
          m.new_edge<names> (m, v, n.string ());
        }
        catch (relational::duplicate_name const& e)
        {
          duplicate (e, i->loc, "view");
          continue;
        }

        size_t ordinal (0);

        for (vector<string>::const_iterator j (i->columns.begin ());
             j != i->columns.end ();
             ++j)
        {
          column& c (
            m.new_node<column> (i->loc, ordinal, string (), sql_type ()));

          try
          {
            m.new_edge<names> (v, c, *j);
          }
          catch (relational::duplicate_name const& e)
          {
            error (diag_, diagnostic::duplicate_definition, i->loc)
              << "column '" << e.name << "' is already defined in view '"
              << n << "'" << endl;
            continue;
          }

          ordinal++;
        }
      }
    }
  }

  //
  // Step 2: resolve the cross-table references. Only runs on a
  // consistent namespace.
  //

  void refine_impl::
  resolve ()
  {
    relational::model& m (*m_);

    // Attach ALTER TABLE constraints and CREATE INDEX indexes.
    //
    for (raw::models::const_iterator mi (ms_.begin ()); mi != ms_.end (); ++mi)
    {
      for (vector<raw::table_key>::const_iterator i (mi->keys.begin ());
           i != mi->keys.end ();
           ++i)
      {
        if (table_info* ti = lookup (i->table))
          ti->keys.push_back (&i->k);
        else
        {
          bool view (m.find<relational::view> (qualify (i->table).string ()));

          error (diag_, diagnostic::reference_error, i->k.loc)
            << (i->k.kind == raw::key::index ? "index" : "constraint")
            << " refers to " << (view ? "view" : "unknown table") << " '"
            << qualify (i->table) << "'" << endl;
        }
      }
    }

    // Foreign keys.
    //
    for (table_infos::iterator i (tables_.begin ()); i != tables_.end (); ++i)
    {
      size_t n (0);

      for (vector<raw::key const*>::const_iterator j (i->keys.begin ());
           j != i->keys.end ();
           ++j)
      {
        if ((*j)->kind == raw::key::foreign)
          foreign_key (*i, **j, ++n);
      }
    }

    // Seed rows.
    //
    for (raw::models::const_iterator mi (ms_.begin ()); mi != ms_.end (); ++mi)
    {
      for (vector<raw::insert>::const_iterator i (mi->inserts.begin ());
           i != mi->inserts.end ();
           ++i)
        insert (*i);
    }
  }

  vector<string> refine_impl::
  declared_primary (table_info const& ti)
  {
    vector<string> r;

    for (vector<raw::column>::const_iterator i (ti.r.columns.begin ());
         i != ti.r.columns.end ();
         ++i)
    {
      if (i->primary)
        r.push_back (i->name);
    }

    if (r.empty ())
    {
      for (vector<raw::key const*>::const_iterator i (ti.keys.begin ());
           i != ti.keys.end ();
           ++i)
      {
        if ((*i)->kind == raw::key::primary)
        {
          r = (*i)->columns;
          break;
        }
      }
    }

    return r;
  }

  void refine_impl::
  foreign_key (table_info& ti, raw::key const& k, size_t n)
  {
    using relational::column;

    relational::model& m (*m_);
    qname rn (qualify (k.referenced_table));
    table_info* rti (lookup (k.referenced_table));

    if (rti == 0)
    {
      bool view (m.find<relational::view> (rn.string ()) != 0);

      error (diag_, diagnostic::reference_error, k.loc)
        << "foreign key in table '" << ti.t.qualified_name () << "' "
        << "references " << (view ? "view" : "unknown table") << " '" << rn
        << "'" << endl;
      return;
    }

    relational::table& rt (rti->t);

    // If the referenced columns are not specified, then this is the
    // referenced table's primary key.
    //
    vector<string> rcs (k.referenced_columns);

    if (rcs.empty ())
    {
      rcs = declared_primary (*rti);

      if (rcs.empty ())
      {
        error (diag_, diagnostic::reference_error, k.loc)
          << "foreign key in table '" << ti.t.qualified_name () << "' "
          << "does not specify referenced columns and table '" << rn
          << "' has no primary key" << endl;
        return;
      }
    }

    if (rcs.size () != k.columns.size ())
    {
      error (diag_, diagnostic::reference_error, k.loc)
        << "foreign key in table '" << ti.t.qualified_name () << "' has "
        << k.columns.size () << " column(s) but references "
        << rcs.size () << " column(s) in table '" << rn << "'" << endl;
      return;
    }

    bool ok (true);

    for (vector<string>::const_iterator i (rcs.begin ()); i != rcs.end (); ++i)
    {
      if (rt.find<column> (*i) == 0)
      {
        error (diag_, diagnostic::reference_error, k.loc)
          << "foreign key in table '" << ti.t.qualified_name () << "' "
          << "references unknown column '" << *i << "' in table '" << rn
          << "'" << endl;
        ok = false;
      }
    }

    if (!ok)
      return;

    relational::foreign_key& fk (
      m.new_node<relational::foreign_key> (k.loc, !k.name.empty (), rn));

    if (!key_columns (fk, ti.t, k.columns, k.loc))
      return;

    fk.on_delete (static_cast<relational::foreign_key::action_type> (
                    k.on_delete));
    fk.on_update (static_cast<relational::foreign_key::action_type> (
                    k.on_update));

    // Use the names as spelled in the referenced table.
    //
    for (vector<string>::const_iterator i (rcs.begin ()); i != rcs.end (); ++i)
      fk.referenced_columns ().push_back (rt.find<column> (*i)->name ());

    try
    {
      m.new_edge<relational::names> (ti.t, fk, key_name (k, "fk", n));
    }
    catch (relational::duplicate_name const& e)
    {
      duplicate (e, k.loc, "constraint");
      return;
    }

    m.new_edge<relational::references> (fk, rt);
  }

  void refine_impl::
  insert (raw::insert const& in)
  {
    using relational::column;
    typedef relational::table::row row;

    qname n (qualify (in.table));
    table_info* ti (lookup (in.table));

    if (ti == 0)
    {
      bool view (m_->find<relational::view> (n.string ()) != 0);

      error (diag_, diagnostic::reference_error, in.loc)
        << "INSERT into " << (view ? "view" : "unknown table") << " '" << n
        << "'" << endl;
      return;
    }

    relational::table& t (ti->t);

    // Map the value positions to column ordinals.
    //
    vector<size_t> map;
    size_t cols (0);

    for (relational::scope::names_iterator i (t.names_begin ());
         i != t.names_end ();
         ++i)
    {
      if (i->nameable ().is_a<column> ())
        cols++;
    }

    if (in.columns.empty ())
    {
      for (size_t i (0); i != cols; ++i)
        map.push_back (i);
    }
    else
    {
      bool ok (true);

      for (vector<string>::const_iterator i (in.columns.begin ());
           i != in.columns.end ();
           ++i)
      {
        if (column* c = t.find<column> (*i))
          map.push_back (c->ordinal ());
        else
        {
          error (diag_, diagnostic::reference_error, in.loc)
            << "INSERT into table '" << n << "' specifies unknown column '"
            << *i << "'" << endl;
          ok = false;
        }
      }

      if (!ok)
        return;
    }

    for (vector<vector<literal> >::const_iterator i (in.rows.begin ());
         i != in.rows.end ();
         ++i)
    {
      if (i->size () != map.size ())
      {
        location l (i->empty () ? in.loc : (*i)[0].loc);

        error (diag_, diagnostic::constraint_error, l)
          << "row has " << i->size () << " value(s) while table '" << n
          << "' has " << map.size () << " column(s)" << endl;
        continue;
      }

      row r (cols);

      for (size_t j (0); j != map.size (); ++j)
        r[map[j]] = (*i)[j];

      t.add_row (r);
    }
  }

  //
  // Step 3: normalize the primary keys and indexes.
  //

  void refine_impl::
  normalize ()
  {
    for (table_infos::iterator i (tables_.begin ()); i != tables_.end (); ++i)
    {
      primary_key (*i);

      set<string> seen;
      size_t n (0);

      for (vector<raw::key const*>::const_iterator j (i->keys.begin ());
           j != i->keys.end ();
           ++j)
      {
        raw::key const& k (**j);

        if (k.kind == raw::key::unique || k.kind == raw::key::index)
          index (*i, k, ++n, seen);
      }
    }
  }

  void refine_impl::
  primary_key (table_info& ti)
  {
    using relational::column;

    relational::model& m (*m_);
    relational::table& t (ti.t);

    // Column-level primary key. There can only be one.
    //
    vector<string> cols;
    raw::column const* first (0);

    for (vector<raw::column>::const_iterator i (ti.r.columns.begin ());
         i != ti.r.columns.end ();
         ++i)
    {
      if (!i->primary)
        continue;

      if (first != 0)
      {
        error (diag_, diagnostic::constraint_error, i->loc)
          << "table '" << t.qualified_name () << "' has multiple primary "
          << "keys: column '" << i->name << "' is declared PRIMARY KEY "
          << "in addition to column '" << first->name << "'" << endl;
        continue;
      }

      first = &*i;
      cols.push_back (i->name);
    }

    // Primary key constraints.
    //
    raw::key const* pk (0);

    for (vector<raw::key const*>::const_iterator i (ti.keys.begin ());
         i != ti.keys.end ();
         ++i)
    {
      raw::key const& k (**i);

      if (k.kind != raw::key::primary)
        continue;

      if (pk != 0)
      {
        error (diag_, diagnostic::constraint_error, k.loc)
          << "table '" << t.qualified_name () << "' has multiple primary "
          << "key constraints" << endl;

        info (diag_, diagnostic::constraint_error, pk->loc)
          << "first primary key constraint is here" << endl;
        continue;
      }

      pk = &k;

      if (first == 0)
        continue;

      // Both column and table-level declarations. They must agree.
      //
      bool match (k.columns.size () == cols.size ());

      for (size_t j (0); match && j != cols.size (); ++j)
        match = ukey (k.columns[j]) == ukey (cols[j]);

      if (!match)
      {
        error (diag_, diagnostic::constraint_error, k.loc)
          << "primary key constraint of table '" << t.qualified_name ()
          << "' does not match column '" << first->name << "' declared "
          << "as PRIMARY KEY" << endl;
      }
    }

    if (first == 0 && pk == 0)
      return;

    location l (pk != 0 ? pk->loc : first->loc);
    bool clustered (pk != 0 ? pk->clustered : first->clustered);
    string name (pk != 0 ? pk->name : first->primary_name);

    if (first == 0)
      cols = pk->columns;

    relational::primary_key& p (
      m.new_node<relational::primary_key> (l, !name.empty (), clustered));

    if (!key_columns (p, t, cols, l))
      return;

    try
    {
      m.new_edge<relational::names> (t, p, name.empty () ? "pk" : name);
    }
    catch (relational::duplicate_name const& e)
    {
      duplicate (e, l, "constraint");
      return;
    }

    for (relational::key::contains_iterator i (p.contains_begin ());
         i != p.contains_end ();
         ++i)
      i->column ().primary (true);
  }

  void refine_impl::
  index (table_info& ti, raw::key const& k, size_t n, set<string>& seen)
  {
    using relational::column;

    relational::model& m (*m_);
    relational::table& t (ti.t);

    bool unique (k.kind == raw::key::unique);

    // Identical (columns, uniqueness) indexes are merged into the first
    // one.
    //
    string sig (unique ? "u" : "n");

    for (vector<string>::const_iterator i (k.columns.begin ());
         i != k.columns.end ();
         ++i)
    {
      sig += '\n';
      sig += ukey (*i);
    }

    if (seen.find (sig) != seen.end ())
      return;

    relational::index& x (
      m.new_node<relational::index> (k.loc, !k.name.empty (), unique,
                                     k.clustered));

    if (!key_columns (x, t, k.columns, k.loc))
      return;

    try
    {
      m.new_edge<relational::names> (t, x, key_name (k, "ix", n));
    }
    catch (relational::duplicate_name const& e)
    {
      duplicate (e, k.loc, unique ? "unique constraint" : "index");
      return;
    }

    seen.insert (sig);
  }

  bool refine_impl::
  key_columns (relational::key& k,
               relational::table& t,
               vector<string> const& columns,
               location const& l)
  {
    using relational::column;

    vector<column*> cs;

    for (vector<string>::const_iterator i (columns.begin ());
         i != columns.end ();
         ++i)
    {
      if (column* c = t.find<column> (*i))
        cs.push_back (c);
      else
      {
        error (diag_, diagnostic::reference_error, l)
          << k.kind () << " refers to unknown column '" << *i << "' in "
          << "table '" << t.qualified_name () << "'" << endl;
        return false;
      }
    }

    for (vector<column*>::iterator i (cs.begin ()); i != cs.end (); ++i)
      m_->new_edge<relational::contains> (k, **i);

    return true;
  }
}

//
// refiner
//

refiner::
refiner (options const& ops)
    : ops_ (ops)
{
}

unique_ptr<relational::model> refiner::
refine (raw::models const& ms, diagnostics& d) const
{
  diagnostics ld;
  refine_impl impl (ops_, ms, ld);
  unique_ptr<relational::model> r (impl.refine ());
  d.append (ld);
  return r;
}
