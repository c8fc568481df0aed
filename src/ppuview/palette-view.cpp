#include <ppuview/palette-view.h>

namespace ppuview {

Result<ViewedPalettes> parseViewedPalettes(const std::string& name) {
    if (name == "all") return Ok(ViewedPalettes::All);
    if (name == "background" || name == "bg") return Ok(ViewedPalettes::BackgroundOnly);
    if (name == "sprites" || name == "sprite") return Ok(ViewedPalettes::SpritesOnly);
    return Err<ViewedPalettes>("unknown palette view '" + name + "'");
}

const char* viewedPalettesName(ViewedPalettes view) {
    switch (view) {
        case ViewedPalettes::BackgroundOnly: return "background";
        case ViewedPalettes::SpritesOnly: return "sprites";
        case ViewedPalettes::All: break;
    }
    return "all";
}

} // namespace ppuview
