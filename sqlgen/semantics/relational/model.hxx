// file      : sqlgen/semantics/relational/model.hxx
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef SQLGEN_SEMANTICS_RELATIONAL_MODEL_HXX
#define SQLGEN_SEMANTICS_RELATIONAL_MODEL_HXX

#include <sqlgen/semantics/relational/elements.hxx>

namespace semantics
{
  namespace relational
  {
    // Refined schema. Tables and views are named with their qualified
    // names and appear in the declaration order.
    //
    class model: public graph<node, edge>, public scope
    {
    public:
      model ()
      {
      }

      virtual string
      kind () const
      {
        return "model";
      }

    public:
      using scope::add_edge_left;
      using scope::add_edge_right;

      using scope::find;

    private:
      model (model const&);
      model& operator= (model const&);
    };
  }
}

#endif // SQLGEN_SEMANTICS_RELATIONAL_MODEL_HXX
