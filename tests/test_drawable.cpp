#include <gtest/gtest.h>
#include <mui/drawable.hpp>
#include <glm/gtc/matrix_transform.hpp>

using namespace mui;

namespace {

// Primitive with no GL objects, for composition tests.
class FakePrimitive final : public Primitive {
public:
    explicit FakePrimitive(PrimitiveKind kind = PrimitiveKind::Geometry) : kind_(kind) {}
    PrimitiveKind kind() const override { return kind_; }
    u32 vertexArray() const override { return 0; }
    void draw() const override {}

private:
    PrimitiveKind kind_;
};

class FixedTransform final : public ModelTransform {
public:
    explicit FixedTransform(const glm::mat4& m) : m_(m) {}
    glm::mat4 modelMatrix(const DrawingContext&) const override { return m_; }

private:
    glm::mat4 m_;
};

class FixedFilter final : public ColorFilter {
public:
    explicit FixedFilter(const glm::mat4& m) : m_(m) {}
    glm::mat4 filterMatrix(const DrawingContext&) const override { return m_; }

private:
    glm::mat4 m_;
};

std::shared_ptr<FixedTransform> translation(f32 x, f32 y) {
    return std::make_shared<FixedTransform>(glm::translate(glm::mat4(1.0f), glm::vec3(x, y, 0.0f)));
}

std::shared_ptr<FixedTransform> scaling(f32 s) {
    return std::make_shared<FixedTransform>(glm::scale(glm::mat4(1.0f), glm::vec3(s, s, 1.0f)));
}

Drawable makeDrawable(PrimitiveKind kind = PrimitiveKind::Geometry) {
    return Drawable(std::make_unique<FakePrimitive>(kind));
}

const DrawingContext kContext{{800, 480}};

} // namespace

// --- Evaluation ---

TEST(Drawable, EmptyCompositionIsIdentity) {
    Drawable d = makeDrawable();
    EXPECT_EQ(d.evaluateModelMatrix(kContext), glm::mat4(1.0f));
    EXPECT_EQ(d.evaluateFilterMatrix(kContext), glm::mat4(1.0f));
}

TEST(Drawable, TranslationsSum) {
    Drawable d = makeDrawable();
    d.addModelTransform(translation(1, 0));
    d.addModelTransform(translation(0, 2));
    d.addModelTransform(translation(3, 3));
    glm::vec4 p = d.evaluateModelMatrix(kContext) * glm::vec4(0, 0, 0, 1);
    EXPECT_FLOAT_EQ(p.x, 4.0f);
    EXPECT_FLOAT_EQ(p.y, 5.0f);
}

TEST(Drawable, FirstAddedAppliesFirst) {
    auto a = scaling(2.0f);
    auto b = translation(10, 0);
    auto c = scaling(3.0f);

    Drawable d = makeDrawable();
    d.addModelTransform(a);
    d.addModelTransform(b);
    d.addModelTransform(c);

    const glm::mat4 expected = c->modelMatrix(kContext) * b->modelMatrix(kContext) *
                               a->modelMatrix(kContext);
    EXPECT_EQ(d.evaluateModelMatrix(kContext), expected);

    // (1,0) -> scale 2 -> (2,0) -> +10 -> (12,0) -> scale 3 -> (36,0)
    glm::vec4 p = d.evaluateModelMatrix(kContext) * glm::vec4(1, 0, 0, 1);
    EXPECT_FLOAT_EQ(p.x, 36.0f);
}

TEST(Drawable, OrderMattersForScaleAndTranslate) {
    auto s = scaling(2.0f);
    auto t = translation(10, 0);

    Drawable scaleFirst = makeDrawable();
    scaleFirst.addModelTransform(s);
    scaleFirst.addModelTransform(t);

    Drawable translateFirst = makeDrawable();
    translateFirst.addModelTransform(t);
    translateFirst.addModelTransform(s);

    glm::vec4 p1 = scaleFirst.evaluateModelMatrix(kContext) * glm::vec4(1, 0, 0, 1);
    glm::vec4 p2 = translateFirst.evaluateModelMatrix(kContext) * glm::vec4(1, 0, 0, 1);
    EXPECT_FLOAT_EQ(p1.x, 12.0f);
    EXPECT_FLOAT_EQ(p2.x, 22.0f);
}

TEST(Drawable, FiltersComposeInInsertionOrder) {
    auto halve = std::make_shared<FixedFilter>(glm::scale(glm::mat4(1.0f), glm::vec3(0.5f)));
    auto shift = std::make_shared<FixedFilter>(glm::translate(glm::mat4(1.0f), glm::vec3(0.25f, 0, 0)));

    Drawable d = makeDrawable(PrimitiveKind::Mesh);
    d.addFilterTransform(halve);
    d.addFilterTransform(shift);

    EXPECT_EQ(d.evaluateFilterMatrix(kContext),
              shift->filterMatrix(kContext) * halve->filterMatrix(kContext));
    // Filters never leak into the model matrix.
    EXPECT_EQ(d.evaluateModelMatrix(kContext), glm::mat4(1.0f));
}

// --- Membership ---

TEST(Drawable, AddingSameTransformTwiceIsNoOp) {
    auto t = translation(5, 5);
    Drawable d = makeDrawable();
    d.addModelTransform(t);
    d.addModelTransform(t);
    EXPECT_EQ(d.modelTransformCount(), 1u);
    glm::vec4 p = d.evaluateModelMatrix(kContext) * glm::vec4(0, 0, 0, 1);
    EXPECT_FLOAT_EQ(p.x, 5.0f);
}

TEST(Drawable, EqualValuedTransformsAreDistinct) {
    Drawable d = makeDrawable();
    d.addModelTransform(translation(1, 0));
    d.addModelTransform(translation(1, 0));
    EXPECT_EQ(d.modelTransformCount(), 2u);
}

TEST(Drawable, RemoveAbsentIsNoOp) {
    auto kept = translation(1, 0);
    auto absent = translation(2, 0);
    Drawable d = makeDrawable();
    d.addModelTransform(kept);
    d.removeModelTransform(*absent);
    EXPECT_EQ(d.modelTransformCount(), 1u);
    EXPECT_TRUE(d.hasModelTransform(*kept));
    EXPECT_FALSE(d.hasModelTransform(*absent));
}

TEST(Drawable, RemoveKeepsOrderOfOthers) {
    auto a = scaling(2.0f);
    auto b = translation(10, 0);
    auto c = scaling(3.0f);
    Drawable d = makeDrawable();
    d.addModelTransform(a);
    d.addModelTransform(b);
    d.addModelTransform(c);
    d.removeModelTransform(*b);

    EXPECT_EQ(d.modelTransformCount(), 2u);
    EXPECT_EQ(d.evaluateModelMatrix(kContext), c->modelMatrix(kContext) * a->modelMatrix(kContext));
}

TEST(Drawable, FilterMembership) {
    auto f = std::make_shared<FixedFilter>(glm::mat4(1.0f));
    Drawable d = makeDrawable(PrimitiveKind::Mesh);
    d.addFilterTransform(f);
    d.addFilterTransform(f);
    EXPECT_EQ(d.filterTransformCount(), 1u);
    EXPECT_TRUE(d.hasFilterTransform(*f));
    d.removeFilterTransform(*f);
    d.removeFilterTransform(*f);
    EXPECT_EQ(d.filterTransformCount(), 0u);
}

TEST(Drawable, NullContributorsAreIgnored) {
    Drawable d = makeDrawable();
    d.addModelTransform(nullptr);
    d.addFilterTransform(nullptr);
    EXPECT_EQ(d.modelTransformCount(), 0u);
    EXPECT_EQ(d.filterTransformCount(), 0u);
}

TEST(Drawable, SharedTransformAffectsEveryOwner) {
    auto t = translation(7, 0);
    Drawable a = makeDrawable();
    Drawable b = makeDrawable();
    a.addModelTransform(t);
    b.addModelTransform(t);
    EXPECT_EQ(a.evaluateModelMatrix(kContext), b.evaluateModelMatrix(kContext));
}

// --- Primitive access ---

TEST(Drawable, PrimitiveAsChecksType) {
    Drawable d = makeDrawable(PrimitiveKind::Mesh);
    EXPECT_EQ(d.primitive().kind(), PrimitiveKind::Mesh);
    EXPECT_NE(d.primitiveAs<FakePrimitive>(), nullptr);
    EXPECT_EQ(d.primitiveAs<LineGeom>(), nullptr);
}
