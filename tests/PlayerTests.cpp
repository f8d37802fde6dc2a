// Player movement, leveling, passive skills and weapon firing.
#include <cassert>
#include <cmath>

#include "../engine/input/ActionMapper.h"
#include "../engine/input/InputState.h"
#include "../game/player/PassiveSkill.h"
#include "../game/player/Player.h"

using namespace Game;
using Engine::ActionState;
using Engine::Vec2;

namespace {
bool near(float a, float b, float eps = 1e-4f) { return std::fabs(a - b) <= eps; }

Player makePlayer() { return Player(Vec2{80.0f, 60.0f}, 160, 120); }
}  // namespace

int main() {
    {
        Player p = makePlayer();
        assert(p.hp() == 100.0f && p.level() == 1 && p.exp() == 0 && p.expToNextLevel() == 10);
        assert(p.weapons().size() == 1 && p.weapons()[0].kind() == WeaponKind::Knife);
        assert(p.facing().x == 1.0f && p.facing().y == 0.0f);
        assert(near(p.speed(), 2.0f));
        assert(p.attacks().empty());
    }
    {
        Player p = makePlayer();
        assert(p.gainExp(10));
        assert(p.level() == 2 && p.exp() == 0 && p.expToNextLevel() == 15);
        assert(near(p.hp(), 110.0f));
        assert(near(p.baseSpeed(), 2.2f));

        assert(!p.gainExp(14));
        assert(p.gainExp(4));
        assert(p.level() == 3 && p.exp() == 3 && p.expToNextLevel() == 22);
    }
    {
        // A huge gain still levels only once.
        Player p = makePlayer();
        assert(p.gainExp(100));
        assert(p.level() == 2 && p.exp() == 90 && p.expToNextLevel() == 15);
    }
    {
        Player p = makePlayer();
        for (int i = 0; i < 20; ++i) p.levelUp();
        assert(p.hp() <= Player::kMaxHp && near(p.hp(), 200.0f));
        assert(near(p.baseSpeed(), 4.0f));
        assert(near(p.speed(), 4.0f));
    }
    {
        Player p = makePlayer();
        ActionState in{};
        in.right = true;
        in.up = true;
        in.moveX = 1.0f;
        in.moveY = -1.0f;
        p.update(in);
        assert(near(p.position().x, 82.0f) && near(p.position().y, 58.0f));
        assert(near(p.facing().x, std::sqrt(0.5f)) && near(p.facing().y, -std::sqrt(0.5f)));

        // Facing is kept without input.
        p.update(ActionState{});
        assert(near(p.facing().x, std::sqrt(0.5f)));
        assert(near(p.position().x, 82.0f));
    }
    {
        // Opposing keys cancel on the facing axis while each still moves the player.
        Engine::InputState keys;
        keys.setKeyDown(Engine::InputKey::Left, true);
        keys.setKeyDown(Engine::InputKey::Right, true);
        keys.setKeyDown(Engine::InputKey::Down, true);
        const ActionState in = Engine::ActionMapper{}.sample(keys);
        assert(in.moveX == 0.0f && in.moveY == 1.0f);

        Player p = makePlayer();
        p.update(in);
        assert(p.facing().x == 0.0f && p.facing().y == 1.0f);
        assert(near(p.position().x, 80.0f) && near(p.position().y, 62.0f));
    }
    {
        Player p = makePlayer();
        p.setPosition(Vec2{151.0f, 1.0f});
        ActionState in{};
        in.right = true;
        in.up = true;
        p.update(in);
        assert(p.position().x == 152.0f && p.position().y == 0.0f);

        p.setPosition(Vec2{1.0f, 111.0f});
        ActionState in2{};
        in2.left = true;
        in2.down = true;
        p.update(in2);
        assert(p.position().x == 0.0f && p.position().y == 112.0f);
    }
    {
        // The knife fires on the first tick and the new attack is advanced once.
        Player p = makePlayer();
        p.update(ActionState{});
        assert(p.attacks().size() == 1);
        assert(near(p.attacks()[0].position().x, 82.0f));
        assert(p.attacks()[0].lifetime() == 29);
        assert(p.weapons()[0].cooldown() == 30);

        for (int i = 0; i < 29; ++i) p.update(ActionState{});
        assert(p.attacks().size() == 1);
        assert(!p.attacks()[0].isAlive());

        // Tick 31: the expired attack is pruned and the next one fires.
        p.update(ActionState{});
        assert(p.attacks().size() == 1);
        assert(p.attacks()[0].isAlive());
    }
    {
        Player p = makePlayer();
        p.addPassiveSkill(PassiveKind::AttackSpeed);
        p.update(ActionState{});
        assert(p.weapons()[0].cooldown() == 27);
    }
    {
        Player p = makePlayer();
        p.addPassiveSkill(PassiveKind::SpeedUp);
        assert(p.passive(PassiveKind::SpeedUp)->level() == 1);
        assert(near(p.speed(), 2.2f));
        p.addPassiveSkill(PassiveKind::SpeedUp);
        assert(p.passive(PassiveKind::SpeedUp)->level() == 2);
        assert(near(p.speed(), 2.4f));
        for (int i = 0; i < 20; ++i) p.addPassiveSkill(PassiveKind::SpeedUp);
        assert(near(p.speed(), 4.0f));
        assert(p.passive(PassiveKind::HpRegen) == nullptr);
    }
    {
        Player p = makePlayer();
        p.addPassiveSkill(PassiveKind::HpRegen);
        p.update(ActionState{});
        assert(near(p.hp(), 100.1f));
        p.heal(500.0f);
        assert(p.hp() == Player::kMaxHp);
        p.update(ActionState{});
        assert(p.hp() == Player::kMaxHp);
        p.takeDamage(1000.0f);
        assert(p.hp() == 0.0f);
    }
    {
        Player p = makePlayer();
        p.addWeapon(WeaponKind::Knife);
        p.addWeapon(WeaponKind::HolyWater);
        assert(p.weapons().size() == 3);
        assert(p.weapons()[2].kind() == WeaponKind::HolyWater && p.weapons()[2].level() == 1);
        p.update(ActionState{});
        assert(p.attacks().size() == 3);
    }
    {
        PassiveSkill s(PassiveKind::AttackSpeed);
        assert(std::fabs(s.bonus() - 0.1) < 1e-9);
        s.levelUp();
        assert(s.level() == 2 && std::fabs(s.bonus() - 0.2) < 1e-9);
    }
    return 0;
}
