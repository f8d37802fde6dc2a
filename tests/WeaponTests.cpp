// Weapon stat formulas, cooldowns, evolution data and attack lifecycles.
#include <cassert>
#include <stdexcept>

#include "../game/weapons/Attack.h"
#include "../game/weapons/Weapon.h"

using namespace Game;
using Engine::Vec2;

int main() {
    {
        Weapon knife(WeaponKind::Knife);
        assert(knife.level() == 1 && knife.damage() == 5 && knife.range() == 12 && knife.maxCooldown() == 30);
        for (int i = 0; i < 4; ++i) knife.levelUp();
        assert(knife.level() == 5 && knife.damage() == 13 && knife.range() == 20 && knife.maxCooldown() == 22);
        for (int i = 0; i < 10; ++i) knife.levelUp();
        assert(knife.maxCooldown() == 10);
    }
    {
        Weapon blade(WeaponKind::MagicBlade);
        assert(blade.damage() == 15 && blade.range() == 24 && blade.maxCooldown() == 30 && blade.dotDamage() == 0);
        Weapon water(WeaponKind::HolyWater);
        assert(water.damage() == 10 && water.range() == 16 && water.maxCooldown() == 30);
        water.levelUp();
        assert(water.damage() == 13 && water.range() == 18 && water.maxCooldown() == 29);
        Weapon flame(WeaponKind::SacredFlame);
        assert(flame.damage() == 20 && flame.range() == 24 && flame.maxCooldown() == 30 && flame.dotDamage() == 5);
        for (int i = 0; i < 30; ++i) flame.levelUp();
        assert(flame.maxCooldown() == 12);
    }
    {
        bool threw = false;
        try {
            Weapon bad(static_cast<WeaponKind>(17));
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }
    {
        Weapon w(WeaponKind::Knife);
        assert(w.canAttack());
        w.startCooldown(0.0);
        assert(w.cooldown() == 30 && !w.canAttack());
        w.update();
        assert(w.cooldown() == 29);
        w.startCooldown(0.5);
        assert(w.cooldown() == 15);
        w.startCooldown(0.1);
        assert(w.cooldown() == 27);
        w.startCooldown(1.5);
        assert(w.cooldown() == 0 && w.canAttack());
        w.update();
        assert(w.cooldown() == 0);
    }
    {
        Weapon knife(WeaponKind::Knife);
        assert(!knife.canEvolve());
        for (int i = 0; i < 4; ++i) knife.levelUp();
        assert(knife.canEvolve());
        auto evo = evolutionFor(WeaponKind::HolyWater);
        assert(evo && evo->to == WeaponKind::SacredFlame && evo->level == 5);
        assert(!evolutionFor(WeaponKind::MagicBlade).has_value());
        Weapon blade(WeaponKind::MagicBlade);
        for (int i = 0; i < 10; ++i) blade.levelUp();
        assert(!blade.canEvolve());
    }
    {
        Weapon knife(WeaponKind::Knife);
        Attack a(Vec2{10.0f, 10.0f}, knife, Vec2{1.0f, 0.0f});
        assert(a.lifetime() == 30 && a.isAlive());
        assert(!a.update());
        assert(a.position().x == 12.0f && a.position().y == 10.0f);
        assert(a.damageThisTick() == 5);
        for (int i = 0; i < 29; ++i) a.update();
        assert(!a.isAlive());

        // Attacks keep the stats of the weapon as it was when fired.
        Attack b(Vec2{0.0f, 0.0f}, knife, Vec2{0.0f, 1.0f});
        knife.levelUp();
        assert(knife.damage() == 7);
        assert(b.weapon().damage() == 5);
        auto box = b.hitbox();
        assert(box.w == 12.0f && box.h == 12.0f);
    }
    {
        Attack blade(Vec2{0.0f, 0.0f}, Weapon(WeaponKind::MagicBlade), Vec2{0.0f, -1.0f});
        assert(blade.lifetime() == 45);
        blade.update();
        assert(blade.position().y == -3.0f);

        Attack water(Vec2{5.0f, 5.0f}, Weapon(WeaponKind::HolyWater), Vec2{1.0f, 0.0f});
        assert(water.lifetime() == 30);
        water.update();
        assert(water.position().x == 5.0f && water.position().y == 5.0f);
        assert(water.damageThisTick() == 10);
    }
    {
        // Sacred flame only hurts on its 15-tick pulse.
        Attack flame(Vec2{0.0f, 0.0f}, Weapon(WeaponKind::SacredFlame), Vec2{1.0f, 0.0f});
        assert(flame.lifetime() == 90);
        int pulses = 0;
        for (int tick = 1; tick <= 90; ++tick) {
            const bool pulse = flame.update();
            assert(pulse == flame.pulsed());
            assert(pulse == (tick % 15 == 0));
            assert(flame.damageThisTick() == (pulse ? 5 : 0));
            if (pulse) ++pulses;
        }
        assert(pulses == 6);
        assert(!flame.isAlive());
        assert(flame.position().x == 0.0f);
    }
    return 0;
}
