#include <catch2/catch.hpp>

#include "core/layer.h"
#include "core/text_raster.h"

using namespace inkcomp;

TEST_CASE("NormalizeRotation accepts multiples of 90 only", "[layer]") {
    int out = -1;
    REQUIRE(NormalizeRotation(0, out));
    CHECK(out == 0);
    REQUIRE(NormalizeRotation(450, out));
    CHECK(out == 90);
    REQUIRE(NormalizeRotation(-90, out));
    CHECK(out == 270);

    out = 7;
    CHECK_FALSE(NormalizeRotation(45, out));
    CHECK(out == 7);
}

TEST_CASE("Layer kind follows the variant alternative", "[layer]") {
    CHECK(KindOf(Layer(ImageLayer{})) == LayerKind::Image);
    CHECK(KindOf(Layer(TextLayer{})) == LayerKind::Text);
    CHECK(KindOf(Layer(RectangleLayer{})) == LayerKind::Rectangle);

    LayerKind k{};
    REQUIRE(LayerKindFromString("rect", k));
    CHECK(k == LayerKind::Rectangle);
    CHECK_FALSE(LayerKindFromString("qr", k));
}

TEST_CASE("Common exposes shared fields", "[layer]") {
    Layer layer = TextLayer{};
    Common(layer).id = "title";
    Common(layer).x = 4;

    const TextLayer& t = std::get<TextLayer>(layer);
    CHECK(t.id == "title");
    CHECK(t.x == 4);
    CHECK(t.visible);
}

TEST_CASE("Patches only touch the fields they set", "[layer]") {
    RectangleLayer r;
    r.id = "box";
    r.x = 3;

    RectanglePatch p;
    p.width = 40;
    p.filled = false;
    ApplyPatch(r, p);

    CHECK(r.id == "box");
    CHECK(r.x == 3);
    CHECK(r.width == 40);
    CHECK(r.height == 10);
    CHECK_FALSE(r.filled);
}

TEST_CASE("Image patch rotation is validated and normalized", "[layer]") {
    Error err;

    ImagePatch bad;
    bad.rotate = 30;
    CHECK_FALSE(ValidatePatch(bad, err));
    CHECK(err.kind == ErrorKind::InvalidInput);

    ImagePatch good;
    good.rotate = -180;
    REQUIRE(ValidatePatch(good, err));

    ImageLayer l;
    ApplyPatch(l, good);
    CHECK(l.rotate == 180);
}

TEST_CASE("Text patch rejects font sizes below 1", "[layer]") {
    TextPatch p;
    p.font_size = 0;
    Error err;
    CHECK_FALSE(ValidatePatch(p, err));
    CHECK(err.kind == ErrorKind::InvalidInput);
}

TEST_CASE("Text patch rejects font sizes above the cap", "[layer]") {
    TextPatch p;
    Error err;
    p.font_size = text::kMaxFontSize;
    CHECK(ValidatePatch(p, err));

    p.font_size = 1000;
    CHECK_FALSE(ValidatePatch(p, err));
    CHECK(err.kind == ErrorKind::InvalidInput);
}
