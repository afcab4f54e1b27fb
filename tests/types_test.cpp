//! # Clean Type Tests
//!
//! Structural equality, primitive classification, definition lookup, the
//! display form, and the generic and function scaffolding around types.

#include "clean/types.hpp"

#include "clean/context.hpp"
#include "render/cache.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>
#include <string>

using namespace cleandoc;
using namespace cleandoc::clean;
using namespace cleandoc::host;

namespace {

auto path_type(const char* name, DefId did, std::vector<GenericArg> args = {},
               std::vector<TypeBinding> bindings = {}) -> TypePtr {
    return Type::resolved_path(external_path(name, std::move(args), std::move(bindings)), did);
}

auto u8_ty() -> TypePtr {
    return Type::primitive(PrimitiveType::U8);
}

auto trait_bound(TypePtr trait_) -> GenericBound {
    return GenericBound{GenericBound::TraitBound{PolyTrait{std::move(trait_), {}}}};
}

} // namespace

// ============================================================================
// Equality
// ============================================================================

TEST(TypeEqualityTest, Structural) {
    auto a = Type::borrowed_ref(Lifetime{"'a"}, Mutability::Mut, Type::slice(u8_ty()));
    auto b = Type::borrowed_ref(Lifetime{"'a"}, Mutability::Mut, Type::slice(u8_ty()));
    auto c = Type::borrowed_ref(Lifetime{"'a"}, Mutability::Not, Type::slice(u8_ty()));

    EXPECT_TRUE(types_equal(a, b));
    EXPECT_FALSE(types_equal(a, c));
    EXPECT_EQ(hash_value(*a), hash_value(*b));
}

TEST(TypeEqualityTest, NullPointers) {
    EXPECT_TRUE(types_equal(nullptr, nullptr));
    EXPECT_FALSE(types_equal(u8_ty(), nullptr));
}

TEST(TypeEqualityTest, PathsCompareArguments) {
    DefId vec{1, 3};
    EXPECT_TRUE(types_equal(path_type("Vec", vec, {u8_ty()}), path_type("Vec", vec, {u8_ty()})));
    EXPECT_FALSE(types_equal(path_type("Vec", vec, {u8_ty()}),
                             path_type("Vec", vec, {Type::primitive(PrimitiveType::U16)})));
}

// ============================================================================
// Classification
// ============================================================================

TEST(TypeQueryTest, PrimitiveType) {
    EXPECT_EQ(u8_ty()->primitive_type(), PrimitiveType::U8);
    EXPECT_EQ(Type::tuple({})->primitive_type(), PrimitiveType::Unit);
    EXPECT_EQ(Type::tuple({u8_ty()})->primitive_type(), PrimitiveType::Tuple);
    EXPECT_EQ(Type::never()->primitive_type(), PrimitiveType::Never);
    EXPECT_EQ(Type::raw_pointer(Mutability::Not, u8_ty())->primitive_type(),
              PrimitiveType::RawPointer);
    EXPECT_EQ(Type::borrowed_ref(std::nullopt, Mutability::Not, Type::slice(u8_ty()))
                  ->primitive_type(),
              PrimitiveType::Slice);
    EXPECT_EQ(Type::borrowed_ref(std::nullopt, Mutability::Not, Type::generic("T"))
                  ->primitive_type(),
              PrimitiveType::Reference);
    EXPECT_FALSE(Type::generic("T")->primitive_type().has_value());
}

TEST(TypeQueryTest, IsPrimitiveLooksThroughPointers) {
    EXPECT_TRUE(Type::borrowed_ref(std::nullopt, Mutability::Not, u8_ty())->is_primitive());
    EXPECT_TRUE(Type::raw_pointer(Mutability::Mut, u8_ty())->is_primitive());
    EXPECT_FALSE(Type::slice(u8_ty())->is_primitive());
}

TEST(TypeQueryTest, MissingPointeeIsNotPrimitive) {
    auto dangling_ref = Type::borrowed_ref(std::nullopt, Mutability::Not, nullptr);
    auto dangling_ptr = Type::raw_pointer(Mutability::Not, nullptr);

    EXPECT_FALSE(dangling_ref->is_primitive());
    EXPECT_FALSE(dangling_ref->primitive_type().has_value());
    EXPECT_FALSE(dangling_ptr->is_primitive());
}

TEST(TypeQueryTest, SelfAndGenerics) {
    EXPECT_TRUE(Type::generic("Self")->is_self_type());
    EXPECT_FALSE(Type::generic("T")->is_self_type());
    EXPECT_TRUE(Type::generic("T")->is_full_generic());
    EXPECT_TRUE(Type::resolved_path(external_path("T"), DefId{0, 4}, true)->is_generic());
}

TEST(TypeQueryTest, GenericsAndBindings) {
    auto item = path_type("Iterator", DefId{1, 2}, {u8_ty(), Lifetime{"'a"}},
                          {TypeBinding{"Item", TypeBinding::Equality{u8_ty()}}});

    auto generics = item->generics();
    ASSERT_TRUE(generics.has_value());
    ASSERT_EQ(generics->size(), 1u);
    EXPECT_TRUE(types_equal((*generics)[0], u8_ty()));

    ASSERT_NE(item->bindings(), nullptr);
    EXPECT_EQ(item->bindings()->front().name, "Item");
    EXPECT_FALSE(u8_ty()->generics().has_value());
}

TEST(TypeQueryTest, Projection) {
    DefId iterator{1, 2};
    auto qpath = Type::qpath("Item", Type::generic("I"), path_type("Iterator", iterator));

    auto proj = qpath->projection();
    ASSERT_TRUE(proj.has_value());
    EXPECT_TRUE(types_equal(std::get<0>(*proj), Type::generic("I")));
    EXPECT_EQ(std::get<1>(*proj), iterator);
    EXPECT_EQ(std::get<2>(*proj), "Item");
    EXPECT_FALSE(u8_ty()->projection().has_value());
}

TEST(TypeQueryTest, DefIdAndPrimitiveLocations) {
    DefId vec{1, 3};
    DefId u8_docs{2, 11};
    DefId ref_docs{2, 12};
    render::Cache cache;
    cache.primitive_locations[PrimitiveType::U8] = u8_docs;
    cache.primitive_locations[PrimitiveType::Reference] = ref_docs;

    EXPECT_EQ(path_type("Vec", vec)->def_id(), vec);
    EXPECT_FALSE(u8_ty()->def_id().has_value());
    EXPECT_EQ(u8_ty()->def_id_full(cache), u8_docs);
    EXPECT_EQ(Type::borrowed_ref(std::nullopt, Mutability::Not, u8_ty())->def_id_full(cache),
              u8_docs);
    EXPECT_EQ(Type::borrowed_ref(std::nullopt, Mutability::Not, Type::generic("T"))
                  ->def_id_full(cache),
              ref_docs);
    EXPECT_EQ(Type::qpath("Item", path_type("Vec", vec), path_type("Iterator", DefId{1, 2}))
                  ->def_id(),
              vec);
    EXPECT_FALSE(Type::infer()->def_id_full(cache).has_value());
}

// ============================================================================
// Display
// ============================================================================

TEST(TypeDisplayTest, Composite) {
    EXPECT_EQ(type_to_string(*Type::borrowed_ref(Lifetime{"'a"}, Mutability::Mut,
                                                 Type::slice(u8_ty()))),
              "&'a mut [u8]");
    EXPECT_EQ(type_to_string(*Type::raw_pointer(Mutability::Not, u8_ty())), "*const u8");
    EXPECT_EQ(type_to_string(*Type::array(u8_ty(), "4")), "[u8; 4]");
    EXPECT_EQ(type_to_string(*Type::tuple({u8_ty()})), "(u8,)");
    EXPECT_EQ(type_to_string(*Type::tuple({})), "()");
    EXPECT_EQ(type_to_string(*Type::never()), "!");
    EXPECT_EQ(type_to_string(*Type::infer()), "_");
}

TEST(TypeDisplayTest, PathsAndProjections) {
    auto iter = path_type("Iterator", DefId{1, 2}, {},
                          {TypeBinding{"Item", TypeBinding::Equality{u8_ty()}}});
    EXPECT_EQ(type_to_string(*iter), "Iterator<Item = u8>");

    auto qpath = Type::qpath("Item", Type::generic("I"), path_type("Iterator", DefId{1, 2}));
    EXPECT_EQ(type_to_string(*qpath), "<I as Iterator>::Item");

    auto impl = Type::impl_trait({trait_bound(path_type("Clone", DefId{1, 5})),
                                  GenericBound{Lifetime::statik()}});
    EXPECT_EQ(type_to_string(*impl), "impl Clone + 'static");
}

TEST(TypeDisplayTest, BareFunction) {
    BareFunctionDecl decl;
    decl.unsafety = Unsafety::Unsafe;
    decl.abi = Abi::C;
    decl.decl.inputs.values.push_back(Argument{Type::primitive(PrimitiveType::I32), "x"});
    decl.decl.output = FnRetTy::returns(Type::primitive(PrimitiveType::I32));

    EXPECT_EQ(type_to_string(*Type::bare_function(decl)), "unsafe extern \"C\" fn(i32) -> i32");
}

TEST(TypeDisplayTest, BoundModifiersAndHigherRanked) {
    GenericBound maybe{GenericBound::TraitBound{PolyTrait{path_type("Sized", DefId{1, 1}), {}},
                                                TraitBoundModifier::Maybe}};
    EXPECT_EQ(bound_to_string(maybe), "?Sized");

    GenericParamDef lifetime{"'a", GenericParamDefKind{GenericParamDefKind::LifetimeParam{}}};
    GenericBound hr{GenericBound::TraitBound{
        PolyTrait{path_type("Fn", DefId{1, 9}), {lifetime}}, TraitBoundModifier::None}};
    EXPECT_EQ(bound_to_string(hr), "for<'a> Fn");
}

// ============================================================================
// Paths and Bindings
// ============================================================================

TEST(PathTest, LastAndWholeName) {
    Path path{true, {PathSegment{"std", AngleBracketedArgs{}}, PathSegment{"vec", AngleBracketedArgs{}},
                     PathSegment{"Vec", AngleBracketedArgs{}}}};

    EXPECT_EQ(path.last(), "Vec");
    EXPECT_EQ(path.last_name(), "Vec");
    EXPECT_EQ(path.whole_name(), "::std::vec::Vec");
}

TEST(PathTest, EmptyPathHasNoLastSegment) {
    Path path;
    EXPECT_THROW((void)path.last(), InvariantError);
}

TEST(TypeBindingTest, ConstraintHasNoType) {
    TypeBinding eq{"Output", TypeBinding::Equality{u8_ty()}};
    TypeBinding constraint{"Item", TypeBinding::Constraint{}};

    EXPECT_TRUE(types_equal(eq.ty(), u8_ty()));
    EXPECT_THROW((void)constraint.ty(), InvariantError);
}

// ============================================================================
// Generics
// ============================================================================

TEST(GenericParamTest, GetTypeReturnsDefaultOrConstType) {
    GenericParamDef with_default{
        "T", GenericParamDefKind{GenericParamDefKind::TypeParam{DefId{0, 7}, {}, u8_ty(), std::nullopt}}};
    GenericParamDef no_default{
        "U", GenericParamDefKind{GenericParamDefKind::TypeParam{DefId{0, 8}, {}, nullptr, std::nullopt}}};
    GenericParamDef constant{
        "N", GenericParamDefKind{GenericParamDefKind::ConstParam{DefId{0, 9},
                                                                 Type::primitive(PrimitiveType::Usize)}}};
    GenericParamDef lifetime{"'a", GenericParamDefKind{GenericParamDefKind::LifetimeParam{}}};

    // A type parameter reports its default, not the parameter itself
    EXPECT_TRUE(types_equal(with_default.get_type(), u8_ty()));
    EXPECT_EQ(no_default.get_type(), nullptr);
    EXPECT_TRUE(types_equal(constant.get_type(), Type::primitive(PrimitiveType::Usize)));
    EXPECT_EQ(lifetime.get_type(), nullptr);

    EXPECT_TRUE(with_default.is_type());
    EXPECT_FALSE(constant.is_type());
    EXPECT_NE(with_default.get_bounds(), nullptr);
    EXPECT_EQ(lifetime.get_bounds(), nullptr);
}

TEST(GenericParamTest, SyntheticImplTraitParam) {
    GenericParamDef synthetic{
        "impl Clone", GenericParamDefKind{GenericParamDefKind::TypeParam{
                          DefId{0, 7}, {}, nullptr, SyntheticTyParamKind::ImplTrait}}};

    EXPECT_TRUE(synthetic.is_synthetic_type_param());
}

TEST(WherePredicateTest, EqualityHasNoBounds) {
    WherePredicate bound{WherePredicate::BoundPredicate{Type::generic("T"),
                                                        {trait_bound(path_type("Clone", DefId{1, 5}))}}};
    WherePredicate eq{WherePredicate::EqPredicate{Type::generic("T"), u8_ty()}};

    ASSERT_NE(bound.get_bounds(), nullptr);
    EXPECT_EQ(bound.get_bounds()->size(), 1u);
    EXPECT_EQ(eq.get_bounds(), nullptr);
}

// ============================================================================
// Bounds Against the Host
// ============================================================================

class SizedBoundTest : public ::testing::Test {
protected:
    void SetUp() override {
        queries.lang.set(LangItem::Sized, sized);
        queries.names[sized] = "Sized";
        queries.paths[sized] = {"marker", "Sized"};
        queries.crate_names[1] = "core";
    }

    test::FakeCompilerQueries queries;
    diag::DiagnosticHandler diag;
    MaxDefIndexTable table;
    DefId sized{1, 40};
};

TEST_F(SizedBoundTest, MaybeSizedRecordsPath) {
    DocContext cx(queries, diag, table);
    GenericBound bound = GenericBound::maybe_sized(cx);

    EXPECT_EQ(bound_to_string(bound), "?Sized");
    ASSERT_NE(bound.get_trait_type(), nullptr);
    EXPECT_EQ(bound.get_trait_type()->def_id(), sized);

    auto it = cx.cache().external_paths.find(sized);
    ASSERT_NE(it, cx.cache().external_paths.end());
    EXPECT_EQ(it->second.fqp, (std::vector<std::string>{"core", "marker", "Sized"}));
    EXPECT_EQ(it->second.type, ItemType::Trait);
}

TEST_F(SizedBoundTest, PlainSizedBound) {
    DocContext cx(queries, diag, table);

    EXPECT_TRUE(trait_bound(path_type("Sized", sized)).is_sized_bound(cx));
    EXPECT_FALSE(GenericBound::maybe_sized(cx).is_sized_bound(cx));
    EXPECT_FALSE(trait_bound(path_type("Clone", DefId{1, 5})).is_sized_bound(cx));
    EXPECT_FALSE(GenericBound{Lifetime::statik()}.is_sized_bound(cx));
}

TEST_F(SizedBoundTest, MissingLangItemIsAFault) {
    test::FakeCompilerQueries bare;
    DocContext cx(bare, diag, table);

    EXPECT_THROW((void)GenericBound::maybe_sized(cx), InvariantError);
}

// ============================================================================
// Functions
// ============================================================================

TEST(FnDeclTest, SelfKinds) {
    auto self_ty = Type::generic("Self");

    Argument by_value{self_ty, "self"};
    Argument by_ref{Type::borrowed_ref(std::nullopt, Mutability::Mut, self_ty), "self"};
    Argument explicit_self{path_type("Box", DefId{1, 20}, {self_ty}), "self"};
    Argument other{u8_ty(), "x"};

    EXPECT_TRUE(std::holds_alternative<Argument::SelfValue>(*by_value.to_self()));
    auto borrowed = by_ref.to_self();
    ASSERT_TRUE(borrowed.has_value());
    ASSERT_TRUE(std::holds_alternative<Argument::SelfBorrowed>(*borrowed));
    EXPECT_EQ(std::get<Argument::SelfBorrowed>(*borrowed).mutability, Mutability::Mut);
    EXPECT_TRUE(std::holds_alternative<Argument::SelfExplicit>(*explicit_self.to_self()));
    EXPECT_FALSE(other.to_self().has_value());
    EXPECT_FALSE(Argument{}.to_self().has_value());
    EXPECT_THROW((void)(Argument{nullptr, "self"}.to_self()), InvariantError);

    FnDecl decl;
    EXPECT_FALSE(decl.self_type().has_value());
    decl.inputs.values = {by_ref, other};
    EXPECT_TRUE(decl.self_type().has_value());
}

TEST(FnDeclTest, AsyncReturnTypeIsUnwrapped) {
    auto future = path_type("Future", DefId{1, 30}, {},
                            {TypeBinding{"Output", TypeBinding::Equality{u8_ty()}}});
    FnDecl decl;
    decl.output = FnRetTy::returns(Type::impl_trait({trait_bound(future)}));

    FnRetTy ret = decl.sugared_async_return_type();
    EXPECT_TRUE(types_equal(ret.ret, u8_ty()));
}

TEST(FnDeclTest, UnexpectedAsyncDesugaringIsAFault) {
    FnDecl plain;
    plain.output = FnRetTy::returns(u8_ty());
    EXPECT_THROW((void)plain.sugared_async_return_type(), InvariantError);

    FnDecl unit;
    EXPECT_THROW((void)unit.sugared_async_return_type(), InvariantError);

    FnDecl no_binding;
    no_binding.output =
        FnRetTy::returns(Type::impl_trait({trait_bound(path_type("Future", DefId{1, 30}))}));
    EXPECT_THROW((void)no_binding.sugared_async_return_type(), InvariantError);
}

TEST(FnRetTyTest, DefaultReturn) {
    EXPECT_TRUE(FnRetTy::default_return().is_default());
    EXPECT_FALSE(FnRetTy::default_return().def_id().has_value());
    EXPECT_EQ(FnRetTy::returns(path_type("Vec", DefId{1, 3})).def_id(), (DefId{1, 3}));
}
