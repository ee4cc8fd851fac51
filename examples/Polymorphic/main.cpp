#include <Morph/Mapping/Mapping.hpp>

#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace Zoo {
  struct Animal {
    virtual ~Animal() = default;
    std::string name;
    friend void MorphReflect(Morph::Mapping::Tag<Animal>, Morph::Mapping::TypeBuilder<Animal> &b) {
      b.Field<&Animal::name>("name");
    }
  };

  struct Dog : Animal {
    bool good{true};
    friend void MorphReflect(Morph::Mapping::Tag<Dog>, Morph::Mapping::TypeBuilder<Dog> &b) {
      b.Base<Animal>();
      b.Field<&Dog::good>("good");
    }
  };

  struct Parrot : Animal {
    int words{0};
    friend void MorphReflect(Morph::Mapping::Tag<Parrot>, Morph::Mapping::TypeBuilder<Parrot> &b) {
      b.Base<Animal>();
      b.Field<&Parrot::words>("words");
    }
  };

  struct AnimalCard {
    std::string name;
    std::string kind;
    friend void MorphReflect(Morph::Mapping::Tag<AnimalCard>, Morph::Mapping::TypeBuilder<AnimalCard> &b) {
      b.Field<&AnimalCard::name>("name");
      b.Field<&AnimalCard::kind>("kind");
    }
  };

  class ZooProfile : public Morph::Mapping::MappingProfile {
  public:
    std::expected<void, Morph::Mapping::Error> Configure(Morph::Mapping::MapRegistry &registry) override {
      auto dog = registry.CreateMap<Dog, AnimalCard>();
      if (!dog)
        return std::unexpected(dog.error());
      dog->ForMember("kind", [](const Dog &d) { return std::string{d.good ? "good dog" : "dog"}; });
      if (auto s = dog->Status(); !s)
        return s;

      auto any = registry.CreateMap<Animal, AnimalCard>();
      if (!any)
        return std::unexpected(any.error());
      any->ForMember("kind", [](const Animal &) { return std::string{"animal"}; });
      return any->Status();
    }
  };
}

int main() {
  using namespace Morph::Mapping;
  using namespace Zoo;

  MapRegistry registry;
  ZooProfile profile;
  if (auto r = registry.AddProfile(profile); !r) {
    std::cerr << FormatError(r.error()) << "\n";
    return 1;
  }
  (void)GetType<Parrot>();

  std::vector<std::shared_ptr<Animal>> animals;
  animals.push_back(std::make_shared<Dog>());
  animals.push_back(nullptr);
  animals.push_back(std::make_shared<Parrot>());
  animals[0]->name = "Rex";
  animals[2]->name = "Polly";

  Mapper mapper{registry};
  auto cards = mapper.MapRange<AnimalCard>(animals);
  if (!cards) {
    std::cerr << FormatError(cards.error()) << "\n";
    return 1;
  }
  for (auto card : *cards)
    std::cout << card.name << ": " << card.kind << "\n";

  // Parrot has no rule of its own; Animal was remembered for AnimalCard.
  if (auto src = registry.FindResolvedSource(GetType<AnimalCard>().GetTypeId()))
    if (auto t = FindTypeById(*src))
      std::cout << "resolved via " << t->QualifiedName() << "\n";
  return 0;
}
