#pragma once
#include "semantics/SemanticIndex.hpp"
#include "syntax/SyntaxTree.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

namespace lfx {

struct TreeReadError : std::runtime_error {
  TreeReadError(const std::string& what, int line, int col)
    : std::runtime_error(std::to_string(line) + ":" + std::to_string(col) + ": " + what),
      line(line), col(col) {}
  int line;
  int col;
};

// A syntax tree together with the semantic index its nodes are bound in.
struct TreeFile {
  std::unique_ptr<SemanticIndex> semantics;
  std::unique_ptr<SyntaxTree> tree;
};

// Reads the S-expression tree format:
//
//   ; comment
//   (declare-type "System.Collections.Generic.List`1")
//   (declare-type "System.Collections.Generic.List<int>"
//                 :definition "System.Collections.Generic.List`1" :args ("int"))
//   (declare-member "Owner.Type" "Name" :kind property :type "T")
//   (source "Program.cs")            ; optional, names the tree
//   (unit (using System.Collections.Generic)
//     (class TestClass (method TestMethod (typename void) (params) (block
//       (local list (typename var)
//         (new :type "System.Collections.Generic.List<int>" (typename "List<int>") (args))))))))
//
// Node forms are `(kind [text] [:type T] [:symbol Owner::Name] child...)`
// with kind names from kindName(). Throws TreeReadError.
TreeFile readTree(std::string_view src, std::string path = {});

// File variant; reports I/O and format errors through `error`.
bool readTreeFile(const std::string& path, TreeFile& out, std::string* error);

} // namespace lfx
