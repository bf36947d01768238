#include "sim/PowerUp.hpp"

const char *GetPowerUpName(PowerUpType type) {
  switch (type) {
  case PowerUpType::Magnet:
    return "Coin Magnet";
  case PowerUpType::Shield:
    return "Shield";
  case PowerUpType::SpeedBoost:
    return "Speed Boost";
  case PowerUpType::StarPower:
    return "Star Power";
  case PowerUpType::Multiplier:
    return "2x Multiplier";
  case PowerUpType::MysteryBox:
    return "Mystery Box";
  }
  return "Power-Up";
}

const char *GetPowerUpDescription(PowerUpType type) {
  switch (type) {
  case PowerUpType::Magnet:
    return "Attracts nearby coins!";
  case PowerUpType::Shield:
    return "Blocks one obstacle hit!";
  case PowerUpType::SpeedBoost:
    return "Super speed + invincibility!";
  case PowerUpType::StarPower:
    return "Fly above everything!";
  case PowerUpType::Multiplier:
    return "Double all score gains!";
  case PowerUpType::MysteryBox:
    return "Random power-up!";
  }
  return "";
}
