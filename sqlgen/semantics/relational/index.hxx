// file      : sqlgen/semantics/relational/index.hxx
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef SQLGEN_SEMANTICS_RELATIONAL_INDEX_HXX
#define SQLGEN_SEMANTICS_RELATIONAL_INDEX_HXX

#include <sqlgen/semantics/relational/elements.hxx>
#include <sqlgen/semantics/relational/key.hxx>

namespace semantics
{
  namespace relational
  {
    // Note that in our model indexes and unique constraints are defined
    // in the table scope.
    //
    class index: public key
    {
    public:
      index (location const& l,
             bool named_in_source,
             bool unique,
             bool clustered)
          : key (l, named_in_source), unique_ (unique), clustered_ (clustered)
      {
      }

      bool
      unique () const
      {
        return unique_;
      }

      bool
      clustered () const
      {
        return clustered_;
      }

      virtual string
      kind () const
      {
        return "index";
      }

    private:
      bool unique_;
      bool clustered_;
    };
  }
}

#endif // SQLGEN_SEMANTICS_RELATIONAL_INDEX_HXX
