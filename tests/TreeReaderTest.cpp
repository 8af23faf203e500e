#include "TestPrograms.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>

using namespace lfx;
using namespace lfx::fixtures;

TEST(TreeReader, BindsTypesAndSymbols) {
  auto file = readTree(R"lfx(
; a property reference and a typed local
(declare-type "Demo.Widget")
(declare-member "Demo.Widget" "Size" :kind property :type "int")
(source "Widget.cs")
(unit
  (class Holder
    (method Run (typename void) (params (param w (typename Widget :type "Demo.Widget")))
      (block
        (expr-stmt (call (id Print) (args (member :symbol "Demo.Widget::Size" (id w) (id Size)))))))))
)lfx");

  const auto& tree = *file.tree;
  const auto& idx = *file.semantics;
  EXPECT_EQ(tree.path(), "Widget.cs");

  auto* widget = idx.lookupType("Demo.Widget");
  ASSERT_NE(widget, nullptr);
  ASSERT_NE(idx.lookupType("int"), nullptr);
  EXPECT_EQ(idx.lookupType("Demo.Missing"), nullptr);

  auto* typeNode = nthOfKind(tree, NodeKind::TypeName, 1);
  ASSERT_NE(typeNode, nullptr);
  EXPECT_EQ(typeNode->text, "Widget");
  EXPECT_EQ(idx.typeOf(*typeNode), widget);

  auto* access = nthOfKind(tree, NodeKind::MemberAccess);
  ASSERT_NE(access, nullptr);
  auto* sym = idx.resolveSymbol(*access);
  ASSERT_NE(sym, nullptr);
  EXPECT_EQ(sym->name, "Size");
  EXPECT_EQ(sym->containingType, widget);
  EXPECT_EQ(idx.typeOf(*access), idx.lookupType("int"));
  EXPECT_EQ(idx.operationOf(*access), OperationKind::PropertyReference);

  auto* call = nthOfKind(tree, NodeKind::Invocation);
  ASSERT_NE(call, nullptr);
  EXPECT_FALSE(idx.operationOf(*call).has_value());
}

TEST(TreeReader, GenericDefinitionsAndInterfaces) {
  auto file = readTree(std::string(listPrelude()) + R"lfx(
(declare-type "Demo.IShape")
(declare-type "Demo.Square" :implements ("Demo.IShape"))
(declare-type "Demo.Box<int>" :definition "Demo.Box`1" :args "int")
(declare-type "Demo.Box`1" :implements ("Demo.IShape"))
(unit)
)lfx");
  const auto& idx = *file.semantics;

  auto* list = idx.lookupType("System.Collections.Generic.List<int>");
  ASSERT_NE(list, nullptr);
  EXPECT_EQ(&list->constructedFrom(), idx.lookupType("System.Collections.Generic.List`1"));
  ASSERT_EQ(list->typeArguments.size(), 1u);
  EXPECT_EQ(list->typeArguments[0]->name, "int");

  auto* shape = idx.lookupType("Demo.IShape");
  ASSERT_NE(shape, nullptr);
  EXPECT_TRUE(idx.lookupType("Demo.Square")->implements(*shape));
  EXPECT_TRUE(idx.lookupType("Demo.Box<int>")->implements(*shape));
  EXPECT_FALSE(list->implements(*shape));

  auto* box = idx.lookupType("Demo.Box<int>");
  EXPECT_EQ(&box->constructedFrom(), idx.lookupType("Demo.Box`1"));
  ASSERT_EQ(box->typeArguments.size(), 1u);
  EXPECT_EQ(box->typeArguments[0], idx.lookupType("int"));
}

TEST(TreeReader, CommasAreWhitespace) {
  auto file = readTree("(unit (class C (method M (typename void) (params) (block"
                       " (expr-stmt (call (id f) (args (num 1), (num 2), (str \"x, y\"))))))))");
  auto* args = nthOfKind(*file.tree, NodeKind::ArgumentList);
  ASSERT_NE(args, nullptr);
  ASSERT_EQ(args->children.size(), 3u);
  EXPECT_EQ(args->children[2]->text, "x, y");
}

TEST(TreeReader, ReportsErrorsWithPosition) {
  try {
    readTree("(unit\n  (bogus))");
    FAIL() << "expected TreeReadError";
  } catch (const TreeReadError& e) {
    EXPECT_EQ(e.line, 2);
    EXPECT_EQ(e.col, 4);
    EXPECT_NE(std::string(e.what()).find("unknown node kind 'bogus'"), std::string::npos);
  }

  EXPECT_THROW(readTree("(unit) (unit)"), TreeReadError);
  EXPECT_THROW(readTree("; nothing here\n"), TreeReadError);
  EXPECT_THROW(readTree("(unit (class C)"), TreeReadError);
  EXPECT_THROW(readTree("(str \"open)"), TreeReadError);
  EXPECT_THROW(readTree("(id x :symbol \"Nowhere::Thing\")"), TreeReadError);
  EXPECT_THROW(readTree("(declare-member \"T\" \"m\" :kind gadget) (unit)"), TreeReadError);

  try {
    readTree("(id x y)");
    FAIL() << "expected TreeReadError";
  } catch (const TreeReadError& e) {
    EXPECT_EQ(e.col, 7);
    EXPECT_NE(std::string(e.what()).find("unexpected atom 'y' in id"), std::string::npos);
  }
}

TEST(TreeReader, FileVariantReportsThroughErrorString) {
  TreeFile out;
  std::string err;
  EXPECT_FALSE(readTreeFile("/nonexistent/lintfix/input.tree", out, &err));
  EXPECT_NE(err.find("Failed to read"), std::string::npos);

  std::string path = ::testing::TempDir() + "lintfix_reader_test.tree";
  {
    std::ofstream os(path);
    os << "(unit (bogus))";
  }
  err.clear();
  EXPECT_FALSE(readTreeFile(path, out, &err));
  EXPECT_NE(err.find("unknown node kind"), std::string::npos);

  {
    std::ofstream os(path);
    os << "(unit (using System))";
  }
  ASSERT_TRUE(readTreeFile(path, out, &err)) << err;
  EXPECT_EQ(out.tree->path(), path);
  EXPECT_EQ(out.tree->text(), "using System;");
  std::remove(path.c_str());
}
